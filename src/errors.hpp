#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace dslist {

// Truncated input: a read wanted more bytes than the buffer had left.
class BufferUnderrun : public std::runtime_error {
    size_t remaining_;
    size_t requested_;

public:
    BufferUnderrun(size_t remaining, size_t requested);

    size_t remaining() const { return remaining_; }
    size_t requested() const { return requested_; }
};

class UnknownLayoutDiscriminator : public std::runtime_error {
    uint32_t value_;

public:
    explicit UnknownLayoutDiscriminator(uint32_t value);

    uint32_t value() const { return value_; }
};

class UnknownFrequencyMarker : public std::runtime_error {
    uint16_t value_;

public:
    explicit UnknownFrequencyMarker(uint16_t value);

    uint16_t value() const { return value_; }
};

class ColumnCapExceeded : public std::runtime_error {
    size_t count_;
    size_t cap_;

public:
    ColumnCapExceeded(size_t count, size_t cap);

    size_t count() const { return count_; }
    size_t cap() const { return cap_; }
};

class MalformedConfigEntry : public std::runtime_error {
    std::string key_;
    std::string value_;

public:
    MalformedConfigEntry(const std::string& key, const std::string& value, const std::string& reason);

    const std::string& key() const { return key_; }
    const std::string& value() const { return value_; }
};

// Structural problems in the textual configuration (syntax, missing
// sections or keys). Line is 0 when the problem is not tied to one line.
class ConfigError : public std::runtime_error {
    size_t line_;

public:
    explicit ConfigError(const std::string& message, size_t line = 0);

    size_t line() const { return line_; }
};

class InvalidPrinterIdentifier : public std::runtime_error {
    std::string identifier_;

public:
    explicit InvalidPrinterIdentifier(const std::string& identifier);

    const std::string& identifier() const { return identifier_; }
};

class StorageError : public std::runtime_error {
    std::filesystem::path path_;

public:
    StorageError(const std::string& message, const std::filesystem::path& path);

    const std::filesystem::path& path() const { return path_; }
};

} // namespace dslist
