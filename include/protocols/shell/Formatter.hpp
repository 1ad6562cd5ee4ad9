#pragma once

#include "fs/model/FileEntry.hpp"

#include <string>
#include <vector>

namespace nf::shell {

enum class OutputFormat { Plain, Json };

// One path per line, newline terminated
std::string renderPlain(const std::vector<fs::model::FileEntry>& entries);

// Compact JSON array of path strings, no trailing newline
std::string renderJson(const std::vector<fs::model::FileEntry>& entries);

std::string render(const std::vector<fs::model::FileEntry>& entries, OutputFormat format);

// Printed in both formats when nothing was collected
std::string noFilesMessage(bool filtered);

}
