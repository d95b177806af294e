#include "shell/commands.hpp"
#include "shell/Router.hpp"
#include "shell/argsHelpers.hpp"
#include "artifact/Cache.hpp"
#include "config/Config.hpp"
#include "logging/LogRegistry.hpp"
#include "util/timestamp.hpp"

#include <chrono>
#include <optional>
#include <fmt/core.h>
#include <nlohmann/json.hpp>

using namespace vc::shell;
using namespace vc::logging;
using namespace vc::util;

namespace {

constexpr auto RESOLVE_SYNOPSIS = "resolve <name> <namespace> <destination>";
constexpr auto PACKAGE_SYNOPSIS = "package <name> <cwd> <file>...";
constexpr auto PUBLISH_SYNOPSIS = "publish <name> <namespace> [--task-id ID] [--run-id ID] [--expires-days N] [--rank N]";
constexpr auto PATH_SYNOPSIS = "path <name>";

std::string profileFor(const CommandCall& call) {
    return optVal(call, "cache").value_or(vc::config::DEFAULT_PROFILE);
}

std::optional<CommandResult> unknownProfile(const CommandCall& call, const CommandContext& ctx, const char* synopsis) {
    const auto profile = profileFor(call);
    if (!ctx.hasProfile || ctx.hasProfile(profile)) return std::nullopt;
    return invalid(fmt::format("Unknown cache profile '{}'\nUsage: vcscache [--cache <profile>] {}\n", profile, synopsis));
}

std::shared_ptr<vc::artifact::Cache> cacheFor(const CommandCall& call, const CommandContext& ctx) {
    return ctx.cache(profileFor(call));
}

}

void vc::shell::registerResolveCommand(Router& router, const CommandContext& ctx) {
    router.registerCommand("resolve", {
        RESOLVE_SYNOPSIS,
        "Extract the artifact into <destination>; exit 3 when it exists nowhere",
        3,
        [ctx](const CommandCall& call) -> CommandResult {
            if (auto bad = unknownProfile(call, ctx, RESOLVE_SYNOPSIS)) return *bad;

            const auto& name = call.positionals[0];
            const auto& ns = call.positionals[1];
            const auto& dest = call.positionals[2];

            if (cacheFor(call, ctx)->resolve(name, ns, dest)) return ok(dest + "\n");
            return {EXIT_NOT_FOUND, "", fmt::format("No artifact for {} under {}\n", name, ns)};
        }
    }, {"use", "get"});
}

void vc::shell::registerPackageCommand(Router& router, const CommandContext& ctx) {
    router.registerCommand("package", {
        PACKAGE_SYNOPSIS,
        "Compress files under <cwd> into the local cache and print its path",
        3,
        [ctx](const CommandCall& call) -> CommandResult {
            if (auto bad = unknownProfile(call, ctx, PACKAGE_SYNOPSIS)) return *bad;

            const std::vector files(call.positionals.begin() + 2, call.positionals.end());
            const auto path = cacheFor(call, ctx)->package(call.positionals[0], call.positionals[1], files);
            return ok(path.string() + "\n");
        }
    }, {"create"});
}

void vc::shell::registerPublishCommand(Router& router, const CommandContext& ctx) {
    router.registerCommand("publish", {
        PUBLISH_SYNOPSIS,
        "Upload the packaged artifact and index it under <namespace>",
        2,
        [ctx](const CommandCall& call) -> CommandResult {
            if (auto bad = unknownProfile(call, ctx, PUBLISH_SYNOPSIS)) return *bad;

            artifact::PublishOptions opts;
            opts.taskId = optVal(call, "task-id");
            opts.runId = optVal(call, "run-id");

            if (const auto days = optVal(call, "expires-days")) {
                const auto n = parseUInt(*days);
                if (!n || *n == 0 || *n > MAX_EXPIRES_DAYS)
                    return invalid(fmt::format("--expires-days must be an integer between 1 and {}, got '{}'\n",
                                               MAX_EXPIRES_DAYS, *days));
                opts.expires = Clock::now() + std::chrono::hours(24) * *n;
            }

            if (const auto rank = optVal(call, "rank")) {
                const auto n = parseInt64(*rank);
                if (!n) return invalid(fmt::format("--rank must be an integer, got '{}'\n", *rank));
                opts.rank = *n;
            }

            const auto& name = call.positionals[0];
            const auto& ns = call.positionals[1];
            const auto record = cacheFor(call, ctx)->publish(name, ns, opts);

            CommandResult res = ok(fmt::format("{} indexed under {} (task {}, rank {}, expires {})\n",
                                               artifact::PathResolver::storageName(name), ns,
                                               record.taskId, record.rank, toIso8601(record.expires)));
            res.data = record;
            res.has_data = true;
            return res;
        }
    }, {"upload"});
}

void vc::shell::registerPathCommand(Router& router, const CommandContext& ctx) {
    router.registerCommand("path", {
        PATH_SYNOPSIS,
        "Print the local cache path and the storage name of an artifact",
        1,
        [ctx](const CommandCall& call) -> CommandResult {
            if (auto bad = unknownProfile(call, ctx, PATH_SYNOPSIS)) return *bad;

            const auto& name = call.positionals[0];
            const auto& paths = cacheFor(call, ctx)->paths();
            const auto local = paths.localPath(name).string();
            const auto storage = artifact::PathResolver::storageName(name);

            CommandResult res = ok(fmt::format("{}\n{}\n", local, storage));
            res.data = {{"localPath", local}, {"storageName", storage}};
            res.has_data = true;
            return res;
        }
    });
}

void vc::shell::registerConfigCommand(Router& router, const CommandContext& ctx) {
    router.registerCommand("config", {
        "config",
        "Print the effective configuration as JSON (secrets redacted)",
        0,
        [ctx](const CommandCall&) -> CommandResult {
            if (!ctx.effectiveConfig) return {EXIT_FATAL, "", "No configuration loaded\n"};
            return ok(ctx.effectiveConfig().dump(2) + "\n");
        }
    });
}

void vc::shell::registerHelpCommand(Router& router) {
    // Router outlives every command it holds.
    router.registerCommand("help", {
        "help",
        "Show this message",
        0,
        [&router](const CommandCall&) -> CommandResult { return ok(router.renderHelp()); }
    }, {"h", "?"});
}

void vc::shell::registerAllCommands(Router& router, const CommandContext& ctx) {
    registerResolveCommand(router, ctx);
    registerPackageCommand(router, ctx);
    registerPublishCommand(router, ctx);
    registerPathCommand(router, ctx);
    registerConfigCommand(router, ctx);
    registerHelpCommand(router);
    LogRegistry::shell()->debug("[Commands] registered");
}
