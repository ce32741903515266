#pragma once
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

namespace dslist {

// Append-only big-endian encoder. The counterpart of BoundedCursor.
class ByteWriter
{
    std::vector<uint8_t> buffer;

public:
    // --- Emitters ---
    void emit(uint8_t byte) { buffer.push_back(byte); }
    void emitWord(uint16_t word);
    void emitLong(uint32_t value);
    void emitBytes(std::span<const uint8_t> bytes);
    void emitZeros(size_t count);

    // Writes `text` into a field of exactly `width` bytes, truncating or
    // padding with NULs.
    void emitFixed(std::string_view text, size_t width);

    size_t size() const { return buffer.size(); }
    const std::vector<uint8_t>& bytes() const { return buffer; }
    std::vector<uint8_t> take() { return std::move(buffer); }
};

} // namespace dslist
