#include "config_file.hpp"
#include "errors.hpp"
#include "storage.hpp"
#include <algorithm>
#include <cctype>
#include <utility>

namespace dslist {

namespace {

std::string lowercase(std::string_view text) {
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string_view strip_inline_comment(std::string_view value) {
    for (size_t i = 1; i < value.size(); ++i) {
        if (value[i] == ';' && std::isspace(static_cast<unsigned char>(value[i - 1]))) {
            return value.substr(0, i);
        }
    }
    return value;
}

class ConfigScanner
{
    std::string_view source;
    size_t cursor = 0;
    size_t lineNumber = 0;

    std::vector<ConfigSection> sections;
    ConfigSection* current = nullptr;
    ConfigEntry* lastEntry = nullptr;

    bool is_eof() const { return cursor >= source.length(); }

    std::string_view next_line() {
        size_t end = source.find('\n', cursor);
        if (end == std::string_view::npos) end = source.length();
        std::string_view line = source.substr(cursor, end - cursor);
        cursor = end + 1;
        ++lineNumber;
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        return line;
    }

    void open_section(std::string_view line) {
        size_t close = line.find(']');
        if (close == std::string_view::npos) {
            throw ConfigError("Unterminated section header", lineNumber);
        }
        std::string name(trim(line.substr(1, close - 1)));
        if (name.empty()) {
            throw ConfigError("Empty section name", lineNumber);
        }

        auto existing = std::find_if(sections.begin(), sections.end(),
                                     [&](const ConfigSection& s) { return s.name == name; });
        if (existing != sections.end()) {
            current = &*existing;
        } else {
            sections.push_back({name, {}});
            current = &sections.back();
        }
        lastEntry = nullptr;
    }

    void add_entry(std::string_view line) {
        size_t separator = line.find_first_of("=:");
        if (separator == std::string_view::npos) {
            throw ConfigError("Expected 'key = value'", lineNumber);
        }
        if (current == nullptr) {
            throw ConfigError("Entry outside of any section", lineNumber);
        }

        std::string key = lowercase(trim(line.substr(0, separator)));
        if (key.empty()) {
            throw ConfigError("Empty key", lineNumber);
        }
        std::string value(trim(strip_inline_comment(line.substr(separator + 1))));

        for (auto& entry : current->entries) {
            if (entry.key == key) {
                entry.value = value;
                entry.line = lineNumber;
                lastEntry = &entry;
                return;
            }
        }
        current->entries.push_back({key, value, lineNumber});
        lastEntry = &current->entries.back();
    }

public:
    explicit ConfigScanner(std::string_view src) : source(src) {}

    std::vector<ConfigSection> scan() {
        while (!is_eof()) {
            std::string_view raw = next_line();
            std::string_view line = trim(raw);

            if (line.empty() || line.front() == '#' || line.front() == ';') {
                continue;
            }

            if (std::isspace(static_cast<unsigned char>(raw.front())) && lastEntry != nullptr) {
                lastEntry->value += "\n";
                lastEntry->value += trim(strip_inline_comment(line));
                continue;
            }

            if (line.front() == '[') {
                open_section(line);
            } else {
                add_entry(line);
            }
        }
        return std::move(sections);
    }
};

} // namespace

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) text.remove_prefix(1);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.remove_suffix(1);
    return text;
}

std::optional<bool> parse_boolean(std::string_view text) {
    std::string word = lowercase(trim(text));
    if (word == "1" || word == "yes" || word == "true" || word == "on") return true;
    if (word == "0" || word == "no" || word == "false" || word == "off") return false;
    return std::nullopt;
}

const ConfigEntry* ConfigSection::find(std::string_view key) const {
    std::string wanted = lowercase(key);
    for (const auto& entry : entries) {
        if (entry.key == wanted) return &entry;
    }
    return nullptr;
}

const std::string& ConfigSection::get(std::string_view key) const {
    const ConfigEntry* entry = find(key);
    if (entry == nullptr) {
        throw ConfigError("No option '" + std::string(key) + "' in section '" + name + "'");
    }
    return entry->value;
}

bool ConfigSection::get_boolean(std::string_view key) const {
    const ConfigEntry* entry = find(key);
    if (entry == nullptr) {
        throw ConfigError("No option '" + std::string(key) + "' in section '" + name + "'");
    }
    auto value = parse_boolean(entry->value);
    if (!value) {
        throw ConfigError("Not a boolean: " + entry->key + " = " + entry->value, entry->line);
    }
    return *value;
}

ConfigFile ConfigFile::parse(std::string_view text) {
    ConfigFile config;
    config.sections = ConfigScanner(text).scan();
    return config;
}

ConfigFile ConfigFile::load(const std::filesystem::path& path) {
    return parse(read_text_file(path));
}

bool ConfigFile::has_section(std::string_view name) const {
    return std::any_of(sections.begin(), sections.end(),
                       [&](const ConfigSection& s) { return s.name == name; });
}

const ConfigSection& ConfigFile::section(std::string_view name) const {
    for (const auto& s : sections) {
        if (s.name == name) return s;
    }
    throw ConfigError("No section: '" + std::string(name) + "'");
}

} // namespace dslist
