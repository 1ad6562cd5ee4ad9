#include "protocols/shell/Formatter.hpp"

#include <nlohmann/json.hpp>

using namespace nf::fs::model;

namespace nf::shell {

std::string renderPlain(const std::vector<FileEntry>& entries) {
    std::string out;
    for (const auto& e : entries) {
        out += e.path.string();
        out.push_back('\n');
    }
    return out;
}

std::string renderJson(const std::vector<FileEntry>& entries) {
    const nlohmann::json j = to_paths(entries);
    // file names are raw bytes, don't throw on invalid UTF-8
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string render(const std::vector<FileEntry>& entries, const OutputFormat format) {
    if (format == OutputFormat::Json) return renderJson(entries);
    return renderPlain(entries);
}

std::string noFilesMessage(const bool filtered) {
    if (filtered) return "No files found with the specified suffixes.\n";
    return "No files found.\n";
}

}
