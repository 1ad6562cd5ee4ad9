#pragma once

#include "protocols/shell/Token.hpp"
#include "protocols/shell/types.hpp"

#include <string>
#include <vector>
#include <optional>

namespace nf::shell {

// Upsert a flag (last wins)
inline void setOpt(CommandCall& c,
                   const std::string& key,
                   const std::optional<std::string>& val,
                   const std::string& spelled = {}) {
    for (auto& opt : c.options) if (opt.key == key) { opt.value = val; opt.spelled = spelled; return; }
    c.options.push_back(FlagKV{key, val, spelled});
}

// All flags are boolean, a Flag never consumes the Word after it.
inline CommandCall parseTokens(const std::vector<Token>& toks) {
    CommandCall call;
    call.options.reserve(8);
    call.positionals.reserve(8);

    size_t i = 0;

    // 1) Command name = leading Word (the program name)
    if (!toks.empty() && toks[0].type == TokenType::Word) {
        call.name = toks[0].text;
        i = 1;
    }

    bool stop_flags = false;

    for (; i < toks.size(); ++i) {
        const Token& t = toks[i];

        // Sentinel: "--" arrives as a Word from the tokenizer
        if (!stop_flags && t.type == TokenType::Word && t.text == "--") {
            stop_flags = true;
            continue;
        }

        if (!stop_flags && t.type == TokenType::Flag) {
            setOpt(call, t.text, std::nullopt, t.spelled);
            continue;
        }

        // Positional (either after "--" or just a Word)
        call.positionals.push_back(t.text);
    }

    return call;
}

}
