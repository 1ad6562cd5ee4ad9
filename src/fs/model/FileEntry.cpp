#include "fs/model/FileEntry.hpp"

namespace nf::fs::model {

std::vector<std::string> to_paths(const std::vector<FileEntry>& entries) {
    std::vector<std::string> out;
    out.reserve(entries.size());
    for (const auto& e : entries) out.push_back(e.path.string());
    return out;
}

} // namespace nf::fs::model
