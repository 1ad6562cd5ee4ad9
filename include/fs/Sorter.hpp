#pragma once

#include "fs/model/FileEntry.hpp"

#include <functional>
#include <string>
#include <vector>

namespace nf::fs {

enum class SortMode { Newest, Oldest, Largest, Smallest };

using EntryComparator = std::function<bool(const model::FileEntry&, const model::FileEntry&)>;

//  Newest   mtime desc (default)
//  Oldest   mtime asc
//  Largest  size  desc
//  Smallest size  asc
EntryComparator comparatorFor(SortMode mode);

// Stable, so equal keys keep walk order.
void sortEntries(std::vector<model::FileEntry>& entries, SortMode mode);

std::string to_string(SortMode mode);

} // namespace nf::fs
