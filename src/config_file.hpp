#pragma once
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dslist {

struct ConfigEntry
{
    std::string key;   // lowercased
    std::string value; // trimmed
    size_t line;
};

class ConfigSection
{
public:
    std::string name;
    std::vector<ConfigEntry> entries; // file order

    const ConfigEntry* find(std::string_view key) const;
    bool has(std::string_view key) const { return find(key) != nullptr; }

    // Both throw ConfigError when the key is missing or not a boolean.
    const std::string& get(std::string_view key) const;
    bool get_boolean(std::string_view key) const;
};

/**
 * INI-style configuration as written for the delivery service tools:
 *
 *     [ds_groups]
 *     short_columns = true
 *     col1 = Name
 *
 *     [ds_destinations]
 *     42 = Front Desk,true,1
 *
 * Lines starting with '#' or ';' are comments, ';' after whitespace starts
 * an inline comment, indented lines continue the previous value. Repeated
 * sections are merged and repeated keys keep their first position but take
 * the last value.
 */
class ConfigFile
{
    std::vector<ConfigSection> sections;

public:
    static ConfigFile parse(std::string_view text);
    static ConfigFile load(const std::filesystem::path& path);

    bool has_section(std::string_view name) const;
    const ConfigSection& section(std::string_view name) const;
    const std::vector<ConfigSection>& all() const { return sections; }
};

// Recognizes 1/yes/true/on and 0/no/false/off, case-insensitively.
std::optional<bool> parse_boolean(std::string_view text);

std::string_view trim(std::string_view text);

} // namespace dslist
