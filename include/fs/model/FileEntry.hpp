#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace nf::fs::model {

struct FileEntry {
    std::filesystem::path path{};   // relative to the walk root, no leading "./"
    std::filesystem::file_time_type mtime{};
    uintmax_t size_bytes{0};
};

std::vector<std::string> to_paths(const std::vector<FileEntry>& entries);

} // namespace nf::fs::model
