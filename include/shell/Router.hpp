#pragma once

#include "shell/types.hpp"

#include <map>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace vc::shell {

class Router {
public:
    void registerCommand(const std::string& name, CommandInfo info, const std::unordered_set<std::string>& aliases = {});

    // Unknown commands and too few positionals yield EXIT_USAGE. Exceptions escaping a
    // handler are logged and reported as EXIT_FATAL with the message on stderr.
    CommandResult execute(const CommandCall& call) const;
    CommandResult execute(const std::vector<std::string>& args) const;

    [[nodiscard]] std::string renderHelp(const std::string& program = "vcscache") const;

    [[nodiscard]] bool hasCommand(const std::string& nameOrAlias) const;

private:
    std::map<std::string, CommandInfo> commands_;            // ordered for help output
    std::unordered_map<std::string, std::string> aliasMap_;  // alias -> canonical

    [[nodiscard]] std::string canonicalFor(const std::string& nameOrAlias) const;

    static std::string normalize(const std::string& s);
};

// What goes to stdout: the JSON payload under --json when the command produced one, the text otherwise.
std::string stdoutFor(const CommandResult& res, bool asJson);

}
