#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace nf::fs {

// Case-insensitive suffix filter built from user supplied extension tokens.
// An empty filter matches every name.
class ExtensionFilter {
public:
    ExtensionFilter() = default;
    explicit ExtensionFilter(const std::vector<std::string>& tokens);

    // "go" -> ".go", ".txt" stays ".txt"; case is preserved
    static std::string normalize(std::string token);

    [[nodiscard]] bool matches(std::string_view filename) const;
    [[nodiscard]] bool empty() const { return suffixes_.empty(); }

    // Normalized, lower-cased suffixes in the order they were given
    [[nodiscard]] const std::vector<std::string>& suffixes() const { return suffixes_; }

private:
    std::vector<std::string> suffixes_;
};

std::string toLower(std::string_view s);

} // namespace nf::fs
