#pragma once

#include "protocols/shell/types.hpp"

#include <cstdio>

namespace nf::shell {

// Writes both streams of a result. Returns the result's exit code, or 1 when
// `out` could not be written or flushed (disk full, closed pipe).
[[nodiscard]] int printResult(const CommandResult& r, std::FILE* out = stdout, std::FILE* err = stderr);

}
