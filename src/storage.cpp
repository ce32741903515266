#include "storage.hpp"
#include "errors.hpp"
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>

namespace dslist {

std::vector<uint8_t> read_binary_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw StorageError("Could not open file", path);
    }

    std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw StorageError("Could not read file", path);
    }
    return data;
}

std::string read_text_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw StorageError("Could not open file", path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

FileTransaction::~FileTransaction() {
    for (const auto& file : staged) {
        if (!file.committed) {
            std::error_code ignored;
            std::filesystem::remove(file.temporary, ignored);
        }
    }
}

std::filesystem::path FileTransaction::temporary_path(const std::filesystem::path& target) {
    std::filesystem::path temporary = target;
    temporary += ".tmp";
    return temporary;
}

void FileTransaction::stage(const std::filesystem::path& target, const std::vector<uint8_t>& data) {
    std::error_code ec;
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
        throw StorageError("Could not create directory (" + ec.message() + ")", target.parent_path());
    }

    StagedFile file{target, temporary_path(target)};
    staged.push_back(file);

    std::ofstream out(file.temporary, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw StorageError("Could not create file", file.temporary);
    }
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    out.close();
    if (out.fail()) {
        throw StorageError("Could not write file", file.temporary);
    }
}

void FileTransaction::commit() {
    for (auto& file : staged) {
        if (file.committed) continue;

        std::error_code ec;
        std::filesystem::rename(file.temporary, file.target, ec);
        if (ec) {
            throw StorageError("Could not move file into place (" + ec.message() + ")", file.target);
        }
        file.committed = true;
    }
}

} // namespace dslist
