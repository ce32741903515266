#include "column_layout.hpp"
#include "bounded_cursor.hpp"
#include "byte_writer.hpp"
#include "errors.hpp"
#include "format.hpp"
#include <utility>

namespace dslist {

namespace {

template <size_t NameSize, size_t Padding>
ColumnEntry read_column(BoundedCursor& cursor) {
    auto [number, name] = cursor.read<U32, Bytes<NameSize>, Skip<Padding>>();
    return {number, trim_padding(name)};
}

} // namespace

size_t ColumnLayout::max_columns() const {
    return compactMode ? format::COMPACT_MAX_COLUMNS : format::WIDE_MAX_COLUMNS;
}

size_t ColumnLayout::name_size() const {
    return compactMode ? format::COMPACT_COLUMN_NAME_SIZE : format::WIDE_COLUMN_NAME_SIZE;
}

void ColumnLayout::add_column(ColumnEntry entry) {
    if (columns.size() >= max_columns()) {
        throw ColumnCapExceeded(columns.size(), max_columns());
    }
    columns.push_back(std::move(entry));
}

std::vector<uint8_t> ColumnLayout::encode() const {
    ByteWriter out;
    out.emitLong(compactMode ? format::GROUP_COMPACT_DISCRIMINATOR : format::GROUP_WIDE_DISCRIMINATOR);
    out.emitBytes(format::GROUP_PREAMBLE);

    const size_t padding = compactMode ? format::COMPACT_COLUMN_PADDING : format::WIDE_COLUMN_PADDING;
    for (const auto& column : columns) {
        out.emitLong(column.number);
        out.emitFixed(column.name, name_size());
        out.emitZeros(padding);
    }
    return out.take();
}

ColumnLayout ColumnLayout::decode(std::span<const uint8_t> data) {
    BoundedCursor cursor(data);

    auto [discriminator] = cursor.read<U32>();
    ColumnLayout layout;
    if (discriminator == format::GROUP_COMPACT_DISCRIMINATOR) {
        layout.compactMode = true;
    } else if (discriminator == format::GROUP_WIDE_DISCRIMINATOR) {
        layout.compactMode = false;
    } else {
        throw UnknownLayoutDiscriminator(discriminator);
    }

    cursor.read<Skip<format::GROUP_PREAMBLE.size()>>();

    for (size_t i = 1; i < layout.max_columns(); ++i) {
        if (cursor.at_end()) break;

        if (layout.compactMode) {
            layout.add_column(read_column<format::COMPACT_COLUMN_NAME_SIZE, format::COMPACT_COLUMN_PADDING>(cursor));
        } else {
            layout.add_column(read_column<format::WIDE_COLUMN_NAME_SIZE, format::WIDE_COLUMN_PADDING>(cursor));
        }
    }
    return layout;
}

void ColumnLayout::load_config(const ConfigSection& section) {
    ColumnLayout layout(section.get_boolean("short_columns"));

    for (uint32_t number = 1; number < layout.max_columns(); ++number) {
        const ConfigEntry* entry = section.find("col" + std::to_string(number));
        if (entry == nullptr) break;
        layout.add_column({number, entry->value});
    }

    *this = std::move(layout);
}

std::ostream& operator<<(std::ostream& os, const ColumnEntry& entry) {
    return os << "ColumnEntry(number = " << entry.number << ", name = '" << entry.name << "')";
}

std::ostream& operator<<(std::ostream& os, const ColumnLayout& layout) {
    os << "ColumnLayout(compact_mode = " << (layout.compact_mode() ? "true" : "false") << ", columns = [";
    for (size_t i = 0; i < layout.entries().size(); ++i) {
        if (i > 0) os << ", ";
        os << layout.entries()[i];
    }
    return os << "])";
}

} // namespace dslist
