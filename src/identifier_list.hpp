#pragma once
#include "config_file.hpp"
#include <cstdint>
#include <ostream>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace dslist {

struct IdentifierEntry
{
    uint32_t id;
    bool use_frequently;
    uint16_t group_number;
    std::string name; // at most 16 bytes survive encoding

    bool operator==(const IdentifierEntry&) const = default;
};

/**
 * The "Identifiers" files: a revision-numbered list of named entries.
 * One instance holds the destinations, another the senders.
 *
 * Entry order is the order the printer displays them in and is never
 * changed here.
 */
class IdentifierList
{
    uint32_t revisionNumber = 1;
    std::vector<IdentifierEntry> items;

public:
    IdentifierList() = default;
    explicit IdentifierList(uint32_t revision, std::vector<IdentifierEntry> entries = {})
        : revisionNumber(revision), items(std::move(entries)) {}

    uint32_t revision_number() const { return revisionNumber; }
    void set_revision_number(uint32_t revision) { revisionNumber = revision; }
    const std::vector<IdentifierEntry>& entries() const { return items; }

    void add_entry(IdentifierEntry entry) { items.push_back(std::move(entry)); }
    void increase() { ++revisionNumber; }

    std::vector<uint8_t> encode() const;
    static IdentifierList decode(std::span<const uint8_t> data);

    /**
     * Replaces the entries with `id = name,use_frequently,group_number`
     * lines, keeping their order. The configuration is treated as an edit,
     * so the revision number goes up by one.
     *
     * Throws MalformedConfigEntry for bad ids, flags or group numbers.
     */
    void load_from_config(const std::vector<ConfigEntry>& entries);

    bool operator==(const IdentifierList&) const = default;
};

std::ostream& operator<<(std::ostream& os, const IdentifierEntry& entry);
std::ostream& operator<<(std::ostream& os, const IdentifierList& list);

} // namespace dslist
