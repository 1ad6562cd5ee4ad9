#pragma once

#include <optional>
#include <string>
#include <vector>

namespace nf::shell {

struct FlagKV {
    std::string key;
    std::optional<std::string> value;
    std::string spelled{};
};

struct CommandCall {
    std::string name;
    std::vector<FlagKV> options;
    std::vector<std::string> positionals;
};

struct CommandResult {
    int exit_code = 0;                 // 0 = success
    std::string stdout_text;           // CLI stdout
    std::string stderr_text;           // CLI stderr
};

}
