#include "identifier_list.hpp"
#include "bounded_cursor.hpp"
#include "byte_writer.hpp"
#include "errors.hpp"
#include "format.hpp"
#include <charconv>
#include <optional>
#include <string_view>
#include <system_error>
#include <utility>

namespace dslist {

namespace {

template <typename T>
std::optional<T> parse_unsigned(std::string_view text) {
    if (text.empty()) return std::nullopt;
    T value{};
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || end != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

IdentifierEntry parse_config_entry(const ConfigEntry& config) {
    const std::string_view value = config.value;

    // Split on the last two commas, names may contain commas themselves.
    size_t groupComma = value.rfind(',');
    size_t flagComma = groupComma == std::string_view::npos || groupComma == 0
                           ? std::string_view::npos
                           : value.rfind(',', groupComma - 1);
    if (flagComma == std::string_view::npos) {
        throw MalformedConfigEntry(config.key, config.value, "expected name,use_frequently,group_number");
    }

    std::string_view name = trim(value.substr(0, flagComma));
    std::string_view flag = trim(value.substr(flagComma + 1, groupComma - flagComma - 1));
    std::string_view group = trim(value.substr(groupComma + 1));

    auto id = parse_unsigned<uint32_t>(trim(config.key));
    if (!id) {
        throw MalformedConfigEntry(config.key, config.value, "id is not a 32-bit unsigned number");
    }
    auto useFrequently = parse_boolean(flag);
    if (!useFrequently) {
        throw MalformedConfigEntry(config.key, config.value, "unknown flag \"" + std::string(flag) + "\"");
    }
    auto groupNumber = parse_unsigned<uint16_t>(group);
    if (!groupNumber) {
        throw MalformedConfigEntry(config.key, config.value, "group number is not a 16-bit unsigned number");
    }

    return {*id, *useFrequently, *groupNumber, std::string(name)};
}

} // namespace

std::vector<uint8_t> IdentifierList::encode() const {
    ByteWriter out;
    out.emitLong(static_cast<uint32_t>(items.size()));
    out.emitZeros(4);
    out.emitLong(revisionNumber);

    for (const auto& entry : items) {
        out.emitLong(entry.id);
        out.emitWord(entry.use_frequently ? format::FREQUENCY_MARKER_FREQUENT : format::FREQUENCY_MARKER_NORMAL);
        out.emitWord(entry.group_number);
        out.emitZeros(format::IDENTIFIER_RESERVED_SIZE);
        out.emitZeros(format::IDENTIFIER_TAG_SIZE);
        out.emit(format::IDENTIFIER_TYPE_BYTE);
        out.emitFixed(entry.name, format::IDENTIFIER_NAME_SIZE);
    }
    return out.take();
}

IdentifierList IdentifierList::decode(std::span<const uint8_t> data) {
    BoundedCursor cursor(data);

    auto [count, revision] = cursor.read<U32, Skip<4>, U32>();
    IdentifierList list(revision);

    for (uint32_t i = 0; i < count; ++i) {
        auto [id, marker] = cursor.read<U32, U16>();
        bool useFrequently;
        if (marker == format::FREQUENCY_MARKER_FREQUENT) {
            useFrequently = true;
        } else if (marker == format::FREQUENCY_MARKER_NORMAL) {
            useFrequently = false;
        } else {
            throw UnknownFrequencyMarker(marker);
        }

        auto [group, name] = cursor.read<U16,
                                         Skip<format::IDENTIFIER_RESERVED_SIZE>,
                                         Skip<format::IDENTIFIER_TAG_SIZE + 1>,
                                         Bytes<format::IDENTIFIER_NAME_SIZE>>();
        list.add_entry({id, useFrequently, group, trim_padding(name)});
    }
    return list;
}

void IdentifierList::load_from_config(const std::vector<ConfigEntry>& entries) {
    std::vector<IdentifierEntry> parsed;
    parsed.reserve(entries.size());
    for (const auto& entry : entries) {
        parsed.push_back(parse_config_entry(entry));
    }

    increase();
    items = std::move(parsed);
}

std::ostream& operator<<(std::ostream& os, const IdentifierEntry& entry) {
    return os << "IdentifierEntry(id = " << entry.id
              << ", use_frequently = " << (entry.use_frequently ? "true" : "false")
              << ", group_number = " << entry.group_number
              << ", name = '" << entry.name << "')";
}

std::ostream& operator<<(std::ostream& os, const IdentifierList& list) {
    os << "IdentifierList(revision_number = " << list.revision_number() << ", entries = [";
    for (size_t i = 0; i < list.entries().size(); ++i) {
        if (i > 0) os << ", ";
        os << list.entries()[i];
    }
    return os << "])";
}

} // namespace dslist
