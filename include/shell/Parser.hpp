#pragma once

#include "shell/types.hpp"

#include <string>
#include <vector>
#include <optional>

namespace vc::shell {

enum class TokenType { Word, Flag };

struct Token {
    TokenType type;
    std::string text;
};

// Flags that never take a value.
inline bool isSwitch(const std::string& key) {
    return key == "help" || key == "h" || key == "json";
}

// Upsert a flag (last wins)
inline void setOpt(CommandCall& c,
                   const std::string& key,
                   const std::optional<std::string>& val) {
    for (auto& [k, v] : c.options) if (k == key) { v = val; return; }
    c.options.push_back(FlagKV{key, val});
}

inline bool looks_negative_number(const std::string& s) {
    if (s.size() < 2 || s[0] != '-') return false;
    for (size_t i = 1; i < s.size(); ++i) if (s[i] < '0' || s[i] > '9') return false;
    return true;
}

// argv is already split by the shell, so no quoting rules apply here.
// "--key=value" is split, "--" is kept as a Word sentinel.
inline std::vector<Token> tokenize(const std::vector<std::string>& args) {
    std::vector<Token> out;
    out.reserve(args.size());

    for (const auto& a : args) {
        if (a == "--" || a == "-" || looks_negative_number(a) || a.empty() || a[0] != '-') {
            out.push_back({TokenType::Word, a});
            continue;
        }

        std::string key = a.substr(a.starts_with("--") ? 2 : 1);
        if (const auto eq = key.find('='); eq != std::string::npos) {
            out.push_back({TokenType::Flag, key.substr(0, eq)});
            out.push_back({TokenType::Word, key.substr(eq + 1)});
            continue;
        }
        out.push_back({TokenType::Flag, std::move(key)});
    }

    return out;
}

inline CommandCall parseTokens(const std::vector<Token>& toks) {
    CommandCall call;
    call.options.reserve(8);
    call.positionals.reserve(8);

    bool stop_flags = false;

    for (size_t i = 0; i < toks.size(); ++i) {
        const Token& t = toks[i];

        // Sentinel: everything after "--" is positional
        if (!stop_flags && t.type == TokenType::Word && t.text == "--") {
            stop_flags = true;
            continue;
        }

        if (!stop_flags && t.type == TokenType::Flag) {
            if (!isSwitch(t.text) && i + 1 < toks.size() && toks[i+1].type == TokenType::Word && toks[i+1].text != "--") {
                setOpt(call, t.text, toks[i+1].text);
                ++i; // consumed value
            } else {
                setOpt(call, t.text, std::nullopt);
            }
            continue;
        }

        // Command name = first Word, flags in front of it are global options
        if (call.name.empty() && !stop_flags) call.name = t.text;
        else call.positionals.push_back(t.text);
    }

    // "vcscache --help" reads as "vcscache help"
    if (call.name.empty())
        for (const auto& [k, v] : call.options)
            if (k == "help" || k == "h") { call.name = "help"; break; }

    return call;
}

inline CommandCall parseArgs(const std::vector<std::string>& args) {
    return parseTokens(tokenize(args));
}

}
