#pragma once

#include <string>
#include <vector>
#include <string_view>

namespace nf::shell {

enum class TokenType { Word, Flag };

struct Token {
    TokenType type;
    std::string text;
    std::string spelled{};   // flag as typed, "-x" or "--xyz"
};

inline void pushFlag(std::vector<Token>& out, std::string k, std::string spelled) {
    // Strip leading '-' if present (callers usually pass already-stripped)
    if (!k.empty() && k[0] == '-') k.erase(k.begin());
    out.push_back({TokenType::Flag, std::move(k), std::move(spelled)});
}
inline void pushWord(std::vector<Token>& out, std::string v) {
    out.push_back({TokenType::Word, std::move(v)});
}

// Expand short bundle "-abc" -> flags a,b,c
inline void expand_bundle(std::string_view bundle, std::vector<Token>& out) {
    for (const char c : bundle) pushFlag(out, std::string(1, c), std::string{'-', c});
}

// Classifies already split process arguments. args[0] is the program name and always a Word.
inline std::vector<Token> tokenize(const std::vector<std::string>& args) {
    std::vector<Token> out;
    out.reserve(args.size() + 4);

    bool stop_flags = false;
    for (const auto& a : args) {
        if (out.empty() || stop_flags) {
            pushWord(out, a);
            continue;
        }

        // Sentinel "--": everything after it is a Word
        if (a == "--") {
            pushWord(out, a);
            stop_flags = true;
            continue;
        }

        // Long flag: --key
        if (a.size() > 2 && a.rfind("--", 0) == 0) {
            pushFlag(out, a.substr(2), a);
            continue;
        }

        // Short flag(s): -k or bundle -abc
        if (a.size() >= 2 && a[0] == '-') {
            expand_bundle(std::string_view(a).substr(1), out);
            continue;
        }

        // Plain word, including a lone "-"
        pushWord(out, a);
    }

    return out;
}

inline std::vector<Token> tokenize(const int argc, char** argv) {
    return tokenize(std::vector<std::string>(argv, argv + argc));
}

inline std::string to_string(const Token& t) {
    switch (t.type) {
    case TokenType::Word: return "Word(" + t.text + ")";
    case TokenType::Flag: return "Flag(" + t.text + ")";
    }
    return "UnknownToken";
}

inline std::string to_string(const std::vector<Token>& tokens) {
    std::string out;
    out.reserve(64 + tokens.size() * 16);
    for (const auto& t : tokens) {
        if (!out.empty()) out += " ";
        out += to_string(t);
    }
    return out;
}

}
