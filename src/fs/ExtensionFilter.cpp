#include "fs/ExtensionFilter.hpp"

#include <algorithm>
#include <cctype>

namespace nf::fs {

std::string toLower(const std::string_view s) {
    std::string out(s);
    std::ranges::transform(out, out.begin(), [](const unsigned char c) { return std::tolower(c); });
    return out;
}

ExtensionFilter::ExtensionFilter(const std::vector<std::string>& tokens) {
    suffixes_.reserve(tokens.size());
    for (const auto& t : tokens) suffixes_.push_back(toLower(normalize(t)));
}

std::string ExtensionFilter::normalize(std::string token) {
    if (!token.starts_with('.')) token.insert(token.begin(), '.');
    return token;
}

bool ExtensionFilter::matches(const std::string_view filename) const {
    if (suffixes_.empty()) return true;
    const auto name = toLower(filename);
    return std::ranges::any_of(suffixes_, [&name](const std::string& sfx) { return name.ends_with(sfx); });
}

} // namespace nf::fs
