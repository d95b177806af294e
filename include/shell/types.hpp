#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace vc::shell {

struct FlagKV {
    std::string key;
    std::optional<std::string> value;
};

struct CommandCall {
    std::string name;
    std::vector<FlagKV> options;
    std::vector<std::string> positionals;
};

struct CommandResult {
    int exit_code = 0;                 // 0 = success
    std::string stdout_text;
    std::string stderr_text;
    nlohmann::json data;               // optional machine-readable payload
    bool has_data = false;
};

// Exit codes of the vcscache binary
constexpr int EXIT_OK = 0;
constexpr int EXIT_FATAL = 1;
constexpr int EXIT_USAGE = 2;
constexpr int EXIT_NOT_FOUND = 3;

using CommandHandler = std::function<CommandResult(const CommandCall&)>;

struct CommandInfo {
    std::string synopsis;              // e.g. "resolve <name> <namespace> <destination>"
    std::string description;
    std::size_t min_positionals = 0;
    CommandHandler handler;
};

}
