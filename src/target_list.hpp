#pragma once
#include "column_layout.hpp"
#include "config_file.hpp"
#include "generation_counter.hpp"
#include "identifier_list.hpp"
#include <filesystem>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace dslist {

// Configuration sections read by TargetList::load_config.
constexpr std::string_view GROUPS_SECTION = "ds_groups";
constexpr std::string_view DESTINATIONS_SECTION = "ds_destinations";
constexpr std::string_view SENDERS_SECTION = "ds_senders";

/**
 * Returns `incoming` with its revision raised to at least the revision of
 * `previous`. Revision numbers of a stored list never go backwards.
 */
IdentifierList merge_revision(IdentifierList incoming, const IdentifierList& previous);

/**
 * Everything the printer with the given hardware address keeps for its
 * delivery service: generation, column layout, destinations and senders.
 *
 * On disk, below a base directory:
 *
 *     Version/D{mac}.ver            generation number
 *     Address/D{mac}.{gen}.grp      column layout
 *     Address/D{mac}.{gen}.dst      destinations
 *     Address/D{mac}.{gen}.snd      senders
 */
class TargetList
{
    std::string printerIdentifier;
    GenerationCounter generationCounter;
    ColumnLayout columnLayout;
    IdentifierList destinationsList;
    IdentifierList sendersList;

    std::filesystem::path address_path(const std::filesystem::path& base, std::string_view suffix) const;

public:
    // Throws InvalidPrinterIdentifier unless `printer` is a MAC address.
    explicit TargetList(std::string_view printer);

    const std::string& printer_identifier() const { return printerIdentifier; }
    const GenerationCounter& generation() const { return generationCounter; }
    const ColumnLayout& layout() const { return columnLayout; }
    const IdentifierList& destinations() const { return destinationsList; }
    const IdentifierList& senders() const { return sendersList; }

    void set_layout(ColumnLayout layout) { columnLayout = std::move(layout); }
    void set_destinations(IdentifierList list);
    void set_senders(IdentifierList list);
    void increase_generation() { generationCounter.increase(); }

    // --- Storage ---
    std::filesystem::path version_path(const std::filesystem::path& base) const;
    std::filesystem::path layout_path(const std::filesystem::path& base) const;
    std::filesystem::path destinations_path(const std::filesystem::path& base) const;
    std::filesystem::path senders_path(const std::filesystem::path& base) const;

    bool exists(const std::filesystem::path& base) const;

    /**
     * Writes all four files for the current generation. The generation file
     * is moved into place last, so it never points at a generation whose
     * files are not complete yet.
     *
     * Files of a published generation are never rewritten: if the generation
     * file already names the current generation this throws StorageError
     * before anything is written. Call increase_generation() first. Files of
     * older generations are left alone.
     */
    void save(const std::filesystem::path& base) const;

    /**
     * Reads the generation file and then that generation's files. Leaves
     * this object untouched if anything fails to open or decode.
     *
     * The stored lists replace the in-memory ones as they are, so their
     * revisions may be lower than revisions set earlier on this object.
     */
    void load(const std::filesystem::path& base);

    // Layout, destinations and senders from configuration. The generation is
    // not part of the configuration and stays as it is.
    void load_config(const ConfigFile& config);
};

std::ostream& operator<<(std::ostream& os, const TargetList& targets);

} // namespace dslist
