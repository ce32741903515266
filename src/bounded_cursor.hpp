#pragma once
#include "errors.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>

namespace dslist {

// --- Field descriptors ---
// Each descriptor knows its width and how to decode itself from a pointer
// that is guaranteed to have `width` readable bytes. Values are big-endian.

struct U8 {
    static constexpr size_t width = 1;
    static std::tuple<uint8_t> decode(const uint8_t* p) { return {p[0]}; }
};

struct U16 {
    static constexpr size_t width = 2;
    static std::tuple<uint16_t> decode(const uint8_t* p) {
        return {static_cast<uint16_t>((static_cast<uint16_t>(p[0]) << 8) | p[1])};
    }
};

struct U32 {
    static constexpr size_t width = 4;
    static std::tuple<uint32_t> decode(const uint8_t* p) {
        return {(static_cast<uint32_t>(p[0]) << 24) |
                (static_cast<uint32_t>(p[1]) << 16) |
                (static_cast<uint32_t>(p[2]) << 8) |
                 static_cast<uint32_t>(p[3])};
    }
};

// Fixed-length raw byte string, NULs included.
template <size_t N>
struct Bytes {
    static constexpr size_t width = N;
    static std::tuple<std::string> decode(const uint8_t* p) {
        return {std::string(reinterpret_cast<const char*>(p), N)};
    }
};

// Padding. Consumes N bytes and produces no value.
template <size_t N>
struct Skip {
    static constexpr size_t width = N;
    static std::tuple<> decode(const uint8_t*) { return {}; }
};

/**
 * Sequential reader over an immutable byte buffer.
 *
 * read<Fields...>() checks the width of the whole descriptor before touching
 * the buffer, so a failed read consumes nothing:
 *
 *     auto [count, revision] = cursor.read<U32, Skip<4>, U32>();
 *
 * The buffer must outlive the cursor.
 */
class BoundedCursor
{
    std::span<const uint8_t> data;
    size_t offset = 0;

    void require(size_t count) const;

    template <size_t I, typename... Fields>
    static constexpr size_t field_offset() {
        constexpr size_t widths[] = {Fields::width..., 0};
        size_t position = 0;
        for (size_t i = 0; i < I; ++i) position += widths[i];
        return position;
    }

    template <typename... Fields, size_t... I>
    static auto decode_fields(const uint8_t* base, std::index_sequence<I...>) {
        return std::tuple_cat(Fields::decode(base + field_offset<I, Fields...>())...);
    }

public:
    explicit BoundedCursor(std::span<const uint8_t> buffer) : data(buffer) {}

    template <typename... Fields>
    auto read() {
        constexpr size_t total = (size_t{0} + ... + Fields::width);
        require(total);
        auto values = decode_fields<Fields...>(data.data() + offset, std::index_sequence_for<Fields...>{});
        offset += total;
        return values;
    }

    size_t remaining() const { return data.size() - offset; }
    bool at_end() const { return offset == data.size(); }
};

// Strips the NUL padding of a fixed-width name field.
std::string trim_padding(std::string_view field);

} // namespace dslist
