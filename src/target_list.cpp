#include "target_list.hpp"
#include "errors.hpp"
#include "printer_id.hpp"
#include "storage.hpp"
#include <algorithm>
#include <string>
#include <utility>

namespace dslist {

IdentifierList merge_revision(IdentifierList incoming, const IdentifierList& previous) {
    incoming.set_revision_number(std::max(incoming.revision_number(), previous.revision_number()));
    return incoming;
}

TargetList::TargetList(std::string_view printer)
    : printerIdentifier(normalize_printer_identifier(printer)) {}

void TargetList::set_destinations(IdentifierList list) {
    destinationsList = merge_revision(std::move(list), destinationsList);
}

void TargetList::set_senders(IdentifierList list) {
    sendersList = merge_revision(std::move(list), sendersList);
}

std::filesystem::path TargetList::address_path(const std::filesystem::path& base, std::string_view suffix) const {
    std::string filename = "D" + printerIdentifier + "." +
                           std::to_string(generationCounter.generation_number()) + "." + std::string(suffix);
    return base / "Address" / filename;
}

std::filesystem::path TargetList::version_path(const std::filesystem::path& base) const {
    return base / "Version" / ("D" + printerIdentifier + ".ver");
}

std::filesystem::path TargetList::layout_path(const std::filesystem::path& base) const {
    return address_path(base, "grp");
}

std::filesystem::path TargetList::destinations_path(const std::filesystem::path& base) const {
    return address_path(base, "dst");
}

std::filesystem::path TargetList::senders_path(const std::filesystem::path& base) const {
    return address_path(base, "snd");
}

bool TargetList::exists(const std::filesystem::path& base) const {
    std::error_code ec;
    return std::filesystem::is_regular_file(version_path(base), ec);
}

void TargetList::save(const std::filesystem::path& base) const {
    if (exists(base)) {
        auto published = GenerationCounter::decode(read_binary_file(version_path(base)));
        if (published.generation_number() == generationCounter.generation_number()) {
            throw StorageError("Generation " + std::to_string(published.generation_number()) +
                                   " is already published, increase the generation before saving",
                               version_path(base));
        }
    }

    FileTransaction transaction;
    transaction.stage(layout_path(base), columnLayout.encode());
    transaction.stage(destinations_path(base), destinationsList.encode());
    transaction.stage(senders_path(base), sendersList.encode());
    transaction.stage(version_path(base), generationCounter.encode());
    transaction.commit();
}

void TargetList::load(const std::filesystem::path& base) {
    TargetList loaded(*this);
    loaded.generationCounter = GenerationCounter::decode(read_binary_file(version_path(base)));
    loaded.columnLayout = ColumnLayout::decode(read_binary_file(loaded.layout_path(base)));
    loaded.destinationsList = IdentifierList::decode(read_binary_file(loaded.destinations_path(base)));
    loaded.sendersList = IdentifierList::decode(read_binary_file(loaded.senders_path(base)));

    *this = std::move(loaded);
}

void TargetList::load_config(const ConfigFile& config) {
    ColumnLayout layout;
    layout.load_config(config.section(GROUPS_SECTION));

    IdentifierList destinations = destinationsList;
    destinations.load_from_config(config.section(DESTINATIONS_SECTION).entries);

    IdentifierList senders = sendersList;
    senders.load_from_config(config.section(SENDERS_SECTION).entries);

    columnLayout = std::move(layout);
    set_destinations(std::move(destinations));
    set_senders(std::move(senders));
}

std::ostream& operator<<(std::ostream& os, const TargetList& targets) {
    return os << "TargetList(printer_identifier = " << targets.printer_identifier()
              << ", generation = " << targets.generation()
              << ", layout = " << targets.layout()
              << ", destinations = " << targets.destinations()
              << ", senders = " << targets.senders() << ")";
}

} // namespace dslist
