#pragma once

#include "fs/ExtensionFilter.hpp"
#include "fs/model/FileEntry.hpp"

#include <filesystem>
#include <vector>

namespace nf::fs {

// Depth-first walk collecting every non-directory entry accepted by the filter.
// Children are visited in lexical name order and symlinks are never descended into;
// a symlink to a directory is collected with the link's own mtime and size 0.
class DirectoryWalker {
public:
    explicit DirectoryWalker(ExtensionFilter filter = {});

    // Throws std::filesystem::filesystem_error if root can't be opened.
    // Unreadable entries below root are logged and skipped.
    [[nodiscard]] std::vector<model::FileEntry> walk(const std::filesystem::path& root) const;

    [[nodiscard]] const ExtensionFilter& filter() const { return filter_; }

private:
    ExtensionFilter filter_;

    void walkDir(const std::filesystem::path& root,
                 const std::filesystem::path& rel,
                 std::vector<model::FileEntry>& out) const;

    void visit(const std::filesystem::directory_entry& entry,
               const std::filesystem::path& root,
               const std::filesystem::path& rel,
               std::vector<model::FileEntry>& out) const;
};

} // namespace nf::fs
