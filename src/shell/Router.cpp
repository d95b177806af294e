#include "shell/Router.hpp"
#include "shell/Parser.hpp"
#include "shell/argsHelpers.hpp"
#include "logging/LogRegistry.hpp"

#include <cctype>
#include <fmt/core.h>

using namespace vc::shell;
using namespace vc::logging;

void Router::registerCommand(const std::string& name, CommandInfo info, const std::unordered_set<std::string>& aliases) {
    const auto key = normalize(name);

    for (const auto& alias : aliases) {
        const auto a = normalize(alias);
        if (aliasMap_.contains(a) && aliasMap_.at(a) != key) {
            LogRegistry::shell()->warn("Alias '{}' already mapped to '{}'; skipping duplicate for '{}'",
                                       a, aliasMap_.at(a), key);
            continue;
        }
        aliasMap_[a] = key;
        LogRegistry::shell()->debug("Alias '{}' mapped to '{}'", a, key);
    }

    if (info.description.empty()) info.description = "No description provided.";
    commands_[key] = std::move(info);
}

std::string Router::canonicalFor(const std::string& nameOrAlias) const {
    std::string n = normalize(nameOrAlias);
    if (commands_.contains(n)) return n;
    if (aliasMap_.contains(n)) return aliasMap_.at(n);
    return n; // unknown; let caller error
}

bool Router::hasCommand(const std::string& nameOrAlias) const {
    return commands_.contains(canonicalFor(nameOrAlias));
}

CommandResult Router::execute(const std::vector<std::string>& args) const {
    return execute(parseArgs(args));
}

CommandResult Router::execute(const CommandCall& call) const {
    if (call.name.empty()) return {EXIT_USAGE, "", "No command provided.\n\n" + renderHelp()};

    const auto canonical = canonicalFor(call.name);
    if (!commands_.contains(canonical))
        return {EXIT_USAGE, "", fmt::format("Unknown command: {}\n\n{}", call.name, renderHelp())};

    const auto& info = commands_.at(canonical);
    if (call.positionals.size() < info.min_positionals)
        return invalid(fmt::format("Usage: vcscache {}\n", info.synopsis));

    LogRegistry::shell()->debug("[Router] Executing command: '{}'", canonical);

    try {
        return info.handler(call);
    } catch (const std::exception& e) {
        LogRegistry::shell()->error("[Router] {} failed: {}", canonical, e.what());
        return {EXIT_FATAL, "", fmt::format("{}: {}\n", canonical, e.what())};
    }
}

std::string Router::renderHelp(const std::string& program) const {
    std::string out = fmt::format("Usage: {} [--config <file>] [--cache <profile>] [--json] <command> [args]\n\nCommands:\n",
                                  program);
    for (const auto& [name, info] : commands_)
        out += fmt::format("  {:<58} {}\n", info.synopsis, info.description);
    return out;
}

std::string Router::normalize(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (const unsigned char c : s) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

std::string vc::shell::stdoutFor(const CommandResult& res, const bool asJson) {
    if (asJson && res.has_data) return res.data.dump(2) + "\n";
    return res.stdout_text;
}
