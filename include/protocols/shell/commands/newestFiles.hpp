#pragma once

#include "protocols/shell/types.hpp"

#include <filesystem>
#include <string>

namespace nf::shell {

std::string usage_newestfiles(const std::string& name = "newestfiles");

// Validates flags, walks root, sorts and renders. Never throws for filesystem failures.
CommandResult handleNewestFiles(const CommandCall& call, const std::filesystem::path& root = ".");

}
