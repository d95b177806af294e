// Config
#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"

// Runtime
#include "runtime/Deps.hpp"
#include "runtime/Environment.hpp"

// Shell
#include "shell/Parser.hpp"
#include "shell/Router.hpp"
#include "shell/argsHelpers.hpp"
#include "shell/commands.hpp"

// Libraries
#include <filesystem>
#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace vc::config;
using namespace vc::logging;
using namespace vc::runtime;
using namespace vc::shell;

namespace {

struct ConfigSource {
    std::filesystem::path path;
    bool required = false;   // named by the caller, so it must exist
};

ConfigSource configSource(const CommandCall& call, const Environment& env) {
    if (const auto p = optVal(call, "config"); p && !p->empty()) return {*p, true};
    if (const auto p = env.get("VCSCACHE_CONFIG")) return {*p, true};
    return {DEFAULT_CONFIG_PATH, false};
}

}

int main(const int argc, char** argv) {
    const std::vector<std::string> args(argv + 1, argv + argc);
    const auto call = parseArgs(args);
    const auto env = std::make_shared<ProcessEnvironment>();

    try {
        const auto source = configSource(call, *env);
        ConfigRegistry::init(source.path, *env, source.required);
        LogRegistry::init(ConfigRegistry::get().logging);
    } catch (const std::exception& e) {
        fmt::print(stderr, "vcscache: failed to load configuration: {}\n", e.what());
        return EXIT_FATAL;
    }

    try {
        const auto& cfg = ConfigRegistry::get();

        std::optional<Deps> deps;
        CommandContext ctx;
        ctx.cache = [&](const std::string& profile) {
            if (!deps) deps = Deps::fromConfig(cfg, env);
            return deps->cache(profile);
        };
        ctx.hasProfile = [&cfg](const std::string& profile) { return cfg.caches.contains(profile); };
        ctx.effectiveConfig = [&cfg] { return nlohmann::json(cfg); };

        Router router;
        registerAllCommands(router, ctx);

        LogRegistry::vcscache()->debug("[*] vcscache {}", call.name.empty() ? "(no command)" : call.name);
        const auto res = router.execute(call);

        if (const auto out = stdoutFor(res, hasFlag(call, "json")); !out.empty()) fmt::print("{}", out);
        if (!res.stderr_text.empty()) fmt::print(stderr, "{}", res.stderr_text);
        return res.exit_code;
    } catch (const std::exception& e) {
        LogRegistry::vcscache()->critical("[!] Fatal error: {}", e.what());
        return EXIT_FATAL;
    }
}
