#pragma once
#include <gtest/gtest.h>
#include "../src/format.hpp"
#include <algorithm>
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

// ============================================================================
// UTILITY FUNCTIONS
// ============================================================================

/**
 * @brief Create a hex dump string for debugging
 */
inline std::string hexDump(const std::vector<uint8_t>& data, size_t maxBytes = 64) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    size_t count = std::min(data.size(), maxBytes);
    for (size_t i = 0; i < count; ++i) {
        if (i > 0 && i % 16 == 0) oss << "\n";
        else if (i > 0) oss << " ";
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    if (data.size() > maxBytes) {
        oss << "... (" << (data.size() - maxBytes) << " more bytes)";
    }
    return oss.str();
}

/**
 * @brief Compare byte vectors with detailed error messages
 */
inline void expectBytes(const std::vector<uint8_t>& actual,
                        const std::vector<uint8_t>& expected,
                        const std::string& msg = "") {
    ASSERT_EQ(actual.size(), expected.size())
        << msg << " size mismatch: expected " << expected.size()
        << " bytes, got " << actual.size() << "\n" << hexDump(actual);
    for (size_t i = 0; i < expected.size(); ++i) {
        EXPECT_EQ(actual[i], expected[i])
            << msg << " byte mismatch at index " << i
            << ": expected 0x" << std::hex << static_cast<int>(expected[i])
            << ", got 0x" << static_cast<int>(actual[i]);
    }
}

/**
 * @brief Extract a range of bytes from a vector
 */
inline std::vector<uint8_t> extractBytes(const std::vector<uint8_t>& data,
                                         size_t start, size_t length) {
    if (start >= data.size()) return {};
    size_t end = std::min(start + length, data.size());
    return std::vector<uint8_t>(data.begin() + start, data.begin() + end);
}

/**
 * @brief Append the bytes of a string literal, NUL padded to width
 */
inline void appendFixed(std::vector<uint8_t>& out, const std::string& text, size_t width) {
    for (size_t i = 0; i < width; ++i) {
        out.push_back(i < text.size() ? static_cast<uint8_t>(text[i]) : 0x00);
    }
}

inline void appendLong(std::vector<uint8_t>& out, uint32_t value) {
    out.push_back(static_cast<uint8_t>(value >> 24));
    out.push_back(static_cast<uint8_t>(value >> 16));
    out.push_back(static_cast<uint8_t>(value >> 8));
    out.push_back(static_cast<uint8_t>(value));
}

inline void appendWord(std::vector<uint8_t>& out, uint16_t value) {
    out.push_back(static_cast<uint8_t>(value >> 8));
    out.push_back(static_cast<uint8_t>(value));
}

inline void writeFile(const std::filesystem::path& path, const std::vector<uint8_t>& data) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
}

// ============================================================================
// BASE TEST FIXTURE
// ============================================================================

/**
 * @brief Gives each test its own empty base directory
 */
class StorageTestBase : public ::testing::Test {
protected:
    std::filesystem::path base;

    void SetUp() override {
        static std::atomic<int> counter{0};
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        base = std::filesystem::temp_directory_path() /
               ("dslist_" + std::string(info->test_suite_name()) + "_" + info->name() + "_" +
                std::to_string(counter++));
        std::filesystem::remove_all(base);
        std::filesystem::create_directories(base);
    }

    void TearDown() override {
        std::error_code ignored;
        std::filesystem::remove_all(base, ignored);
    }

    std::vector<std::filesystem::path> filesBelow(const std::filesystem::path& dir) const {
        std::vector<std::filesystem::path> files;
        for (const auto& entry : std::filesystem::recursive_directory_iterator(dir)) {
            if (entry.is_regular_file()) files.push_back(entry.path());
        }
        std::sort(files.begin(), files.end());
        return files;
    }
};
