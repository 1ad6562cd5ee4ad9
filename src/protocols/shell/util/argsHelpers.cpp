#include "protocols/shell/util/argsHelpers.hpp"

#include <algorithm>
#include <utility>

using namespace nf::fs;

namespace nf::shell {

CommandResult invalid(std::string msg) { return {2, "", std::move(msg)}; }
CommandResult ok(std::string out) { return {0, std::move(out), ""}; }
CommandResult fail(std::string msg) { return {1, "", std::move(msg)}; }

CommandResult invalid(std::string msg, std::string usageText) {
    return {2, "", std::move(msg) + std::move(usageText)};
}

bool hasFlag(const CommandCall& c, const std::string& key) {
    for (const auto& opt : c.options) if (opt.key == key) return !opt.value.has_value();
    return false;
}

bool hasFlag(const CommandCall& c, const std::vector<std::string>& keys) {
    for (const auto& k : keys) if (hasFlag(c, k)) return true;
    return false;
}

std::optional<std::string> firstUnknownFlag(const CommandCall& c, const std::vector<std::string>& known) {
    for (const auto& opt : c.options) {
        if (std::ranges::find(known, opt.key) != known.end()) continue;
        if (!opt.spelled.empty()) return opt.spelled;
        return (opt.key.size() == 1 ? "-" : "--") + opt.key;
    }
    return std::nullopt;
}

SortModeParse parseSortMode(const CommandCall& c) {
    const bool oldest = hasFlag(c, std::vector<std::string>{"o", "oldest"});
    const bool largest = hasFlag(c, std::vector<std::string>{"l", "largest"});
    const bool smallest = hasFlag(c, std::vector<std::string>{"s", "smallest"});

    if (static_cast<int>(oldest) + static_cast<int>(largest) + static_cast<int>(smallest) > 1)
        return {false, SortMode::Newest, "Error: Only one sort option can be specified at a time"};

    if (oldest) return {true, SortMode::Oldest, ""};
    if (largest) return {true, SortMode::Largest, ""};
    if (smallest) return {true, SortMode::Smallest, ""};
    return {true, SortMode::Newest, ""};
}

}
