#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace dslist {

std::vector<uint8_t> read_binary_file(const std::filesystem::path& path);
std::string read_text_file(const std::filesystem::path& path);

/**
 * Replaces a group of files as one unit.
 *
 * stage() writes the data next to its target under a ".tmp" name. commit()
 * renames the staged files into place in the order they were staged, so the
 * file that makes the others visible (the version pointer) goes last.
 * Staged files that were never committed are removed on destruction.
 */
class FileTransaction
{
    struct StagedFile {
        std::filesystem::path target;
        std::filesystem::path temporary;
        bool committed = false;
    };

    std::vector<StagedFile> staged;

public:
    FileTransaction() = default;
    FileTransaction(const FileTransaction&) = delete;
    FileTransaction& operator=(const FileTransaction&) = delete;
    ~FileTransaction();

    void stage(const std::filesystem::path& target, const std::vector<uint8_t>& data);
    void commit();

    static std::filesystem::path temporary_path(const std::filesystem::path& target);
};

} // namespace dslist
