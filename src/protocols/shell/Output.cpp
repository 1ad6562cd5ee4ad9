#include "protocols/shell/Output.hpp"
#include "logging/LogRegistry.hpp"

#include <fmt/core.h>
#include <cerrno>
#include <cstring>
#include <system_error>

using namespace nf::logging;

namespace nf::shell {

int printResult(const CommandResult& r, std::FILE* out, std::FILE* err) {
    try {
        if (!r.stdout_text.empty()) fmt::print(out, "{}", r.stdout_text);
    } catch (const std::system_error& e) {
        fmt::print(err, "newestfiles: error writing output: {}\n", e.what());
        return 1;
    }

    if (std::fflush(out) != 0 || std::ferror(out)) {
        const int e = errno;
        LogRegistry::shell()->debug("[printResult] flush failed after {} bytes", r.stdout_text.size());
        fmt::print(err, "newestfiles: error writing output: {}\n", std::strerror(e));
        return 1;
    }

    if (!r.stderr_text.empty()) fmt::print(err, "{}", r.stderr_text);
    return r.exit_code;
}

}
