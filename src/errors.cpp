#include "errors.hpp"
#include <iomanip>
#include <sstream>

namespace dslist {

namespace {
std::string hex(uint32_t value, int width) {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::setw(width) << std::setfill('0') << value;
    return oss.str();
}
} // namespace

BufferUnderrun::BufferUnderrun(size_t remaining, size_t requested)
    : std::runtime_error("Not enough buffer left for unpacking (left " + std::to_string(remaining) +
                         ", wanted " + std::to_string(requested) + ")"),
      remaining_(remaining), requested_(requested) {}

UnknownLayoutDiscriminator::UnknownLayoutDiscriminator(uint32_t value)
    : std::runtime_error("Unknown column format (" + hex(value, 8) + ")"), value_(value) {}

UnknownFrequencyMarker::UnknownFrequencyMarker(uint16_t value)
    : std::runtime_error("Unknown flag in identifier entry (" + hex(value, 4) + ")"), value_(value) {}

ColumnCapExceeded::ColumnCapExceeded(size_t count, size_t cap)
    : std::runtime_error("Maximum number of columns in group exceeded (have " + std::to_string(count) +
                         ", max " + std::to_string(cap) + ")"),
      count_(count), cap_(cap) {}

MalformedConfigEntry::MalformedConfigEntry(const std::string& key, const std::string& value,
                                           const std::string& reason)
    : std::runtime_error("Malformed identifier config entry " + key + " = \"" + value + "\": " + reason),
      key_(key), value_(value) {}

ConfigError::ConfigError(const std::string& message, size_t line)
    : std::runtime_error(line == 0 ? message : "line " + std::to_string(line) + ": " + message),
      line_(line) {}

InvalidPrinterIdentifier::InvalidPrinterIdentifier(const std::string& identifier)
    : std::runtime_error("Invalid printer hardware address: \"" + identifier + "\""),
      identifier_(identifier) {}

StorageError::StorageError(const std::string& message, const std::filesystem::path& path)
    : std::runtime_error(message + ": " + path.string()), path_(path) {}

} // namespace dslist
