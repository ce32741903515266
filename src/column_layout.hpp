#pragma once
#include "config_file.hpp"
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <span>
#include <string>
#include <vector>

namespace dslist {

struct ColumnEntry
{
    uint32_t number;
    std::string name;

    bool operator==(const ColumnEntry&) const = default;
};

/**
 * The "Group" file: which address book columns the printer displays.
 *
 * Compact mode allows up to 10 columns with 4-byte names, wide mode up to 5
 * columns with 8-byte names. The mode decides the record layout on disk, so
 * it is fixed at construction (or by decode/load_config).
 */
class ColumnLayout
{
    bool compactMode = true;
    std::vector<ColumnEntry> columns;

public:
    ColumnLayout() = default;
    explicit ColumnLayout(bool compact) : compactMode(compact) {}

    bool compact_mode() const { return compactMode; }
    size_t max_columns() const;
    size_t name_size() const;
    const std::vector<ColumnEntry>& entries() const { return columns; }

    // Throws ColumnCapExceeded once max_columns() entries are present.
    void add_column(ColumnEntry entry);

    std::vector<uint8_t> encode() const;

    /**
     * Reads at most max_columns() - 1 column records, which is all the
     * device ever writes. Stops early when the data ends on a record
     * boundary; anything after the last record it reads is ignored.
     */
    static ColumnLayout decode(std::span<const uint8_t> data);

    // Replaces mode and columns from a [ds_groups] style section.
    void load_config(const ConfigSection& section);

    bool operator==(const ColumnLayout&) const = default;
};

std::ostream& operator<<(std::ostream& os, const ColumnEntry& entry);
std::ostream& operator<<(std::ostream& os, const ColumnLayout& layout);

} // namespace dslist
