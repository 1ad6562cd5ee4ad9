// Shell
#include "protocols/shell/Output.hpp"
#include "protocols/shell/Parser.hpp"
#include "protocols/shell/Token.hpp"
#include "protocols/shell/commands/newestFiles.hpp"

// Misc
#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"

// Libraries
#include <fmt/core.h>
#include <exception>

using namespace nf::config;
using namespace nf::logging;
using namespace nf::shell;

int main(int argc, char** argv) {
    try {
        ConfigRegistry::init();
        LogRegistry::init();
    } catch (const std::exception& e) {
        fmt::print(stderr, "newestfiles: {}\n", e.what());
        return 1;
    }

    const auto toks = tokenize(argc, argv);
    LogRegistry::shell()->trace("[main] Tokens: {}", to_string(toks));

    return printResult(handleNewestFiles(parseTokens(toks)));
}
