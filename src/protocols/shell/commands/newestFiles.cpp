#include "protocols/shell/commands/newestFiles.hpp"
#include "protocols/shell/Formatter.hpp"
#include "protocols/shell/util/argsHelpers.hpp"
#include "fs/DirectoryWalker.hpp"
#include "fs/ExtensionFilter.hpp"
#include "fs/Sorter.hpp"
#include "logging/LogRegistry.hpp"

#include <filesystem>
#include <vector>

using namespace nf::shell;
using namespace nf::fs;
using namespace nf::logging;

static const std::vector<std::string> KNOWN_FLAGS = {
    "j", "json",
    "o", "oldest",
    "l", "largest",
    "s", "smallest",
    "h", "help"
};

std::string nf::shell::usage_newestfiles(const std::string& name) {
    return
        "Usage:\n"
        "  " + name + " [-j] [-o|-l|-s] [ext1 [ext2 ...]]\n"
        "\n"
        "Lists files under the current directory, newest first.\n"
        "Extensions may be given with or without the leading '.', matching ignores case.\n"
        "With no extensions every file is listed.\n"
        "\n"
        "Options:\n"
        "  -j, --json       output a JSON array of paths\n"
        "  -o, --oldest     sort oldest to newest\n"
        "  -l, --largest    sort largest files first\n"
        "  -s, --smallest   sort smallest files first\n"
        "  -h, --help       show this help\n"
        "  --               treat all following arguments as extensions\n";
}

CommandResult nf::shell::handleNewestFiles(const CommandCall& call, const std::filesystem::path& root) {
    const auto name = call.name.empty() ? std::string("newestfiles") : std::filesystem::path(call.name).filename().string();

    if (hasFlag(call, std::vector<std::string>{"h", "help"})) return ok(usage_newestfiles(name));

    if (const auto unknown = firstUnknownFlag(call, KNOWN_FLAGS)) {
        LogRegistry::shell()->debug("[newestfiles] Rejecting unknown flag {}", *unknown);
        return invalid("Unknown flag: " + *unknown + "\n", usage_newestfiles(name));
    }

    const auto sort = parseSortMode(call);
    if (!sort.ok) return invalid(sort.error + "\n");

    const auto format = hasFlag(call, std::vector<std::string>{"j", "json"}) ? OutputFormat::Json : OutputFormat::Plain;
    const DirectoryWalker walker(ExtensionFilter(call.positionals));

    LogRegistry::shell()->debug("[newestfiles] sort={} json={} filters={}",
                                to_string(sort.value), format == OutputFormat::Json, walker.filter().suffixes().size());

    std::vector<model::FileEntry> entries;
    try {
        entries = walker.walk(root);
    } catch (const std::filesystem::filesystem_error& e) {
        LogRegistry::fs()->debug("[newestfiles] Walk of {} aborted: {}", root.string(), e.what());
        return fail("Error walking directory: " + std::string(e.what()) + "\n");
    }

    if (entries.empty()) return ok(noFilesMessage(!walker.filter().empty()));

    sortEntries(entries, sort.value);
    return ok(render(entries, format));
}
