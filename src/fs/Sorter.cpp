#include "fs/Sorter.hpp"

#include <algorithm>

using namespace nf::fs::model;

namespace nf::fs {

EntryComparator comparatorFor(const SortMode mode) {
    switch (mode) {
    case SortMode::Oldest:
        return [](const FileEntry& a, const FileEntry& b) { return a.mtime < b.mtime; };
    case SortMode::Largest:
        return [](const FileEntry& a, const FileEntry& b) { return a.size_bytes > b.size_bytes; };
    case SortMode::Smallest:
        return [](const FileEntry& a, const FileEntry& b) { return a.size_bytes < b.size_bytes; };
    case SortMode::Newest:
        break;
    }
    return [](const FileEntry& a, const FileEntry& b) { return a.mtime > b.mtime; };
}

void sortEntries(std::vector<FileEntry>& entries, const SortMode mode) {
    std::ranges::stable_sort(entries, comparatorFor(mode));
}

std::string to_string(const SortMode mode) {
    switch (mode) {
    case SortMode::Newest: return "newest";
    case SortMode::Oldest: return "oldest";
    case SortMode::Largest: return "largest";
    case SortMode::Smallest: return "smallest";
    }
    return "unknown";
}

} // namespace nf::fs
