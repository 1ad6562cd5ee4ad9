#pragma once

#include "protocols/shell/types.hpp"
#include "fs/Sorter.hpp"

#include <optional>
#include <string>
#include <vector>

namespace nf::shell {

struct SortModeParse {
    bool ok = false;
    fs::SortMode value = fs::SortMode::Newest;
    std::string error;
};

CommandResult invalid(std::string msg);
CommandResult invalid(std::string msg, std::string usageText);
CommandResult ok(std::string out);
CommandResult fail(std::string msg);

[[nodiscard]] bool hasFlag(const CommandCall& c, const std::string& key);
[[nodiscard]] bool hasFlag(const CommandCall& c, const std::vector<std::string>& keys);

// First option whose key is not in `known`, rendered the way it was typed ("-x" or "--xyz")
std::optional<std::string> firstUnknownFlag(const CommandCall& c, const std::vector<std::string>& known);

// -o, -l and -s are mutually exclusive; none of them means newest first
SortModeParse parseSortMode(const CommandCall& c);

}
