#pragma once

#include <functional>
#include <memory>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace vc::artifact { class Cache; }

namespace vc::shell {

class Router;

// Upper bound for publish --expires-days, ten years.
constexpr unsigned int MAX_EXPIRES_DAYS = 3650;

struct CommandContext {
    // Builds the cache of a named profile; throws PreconditionError for unknown ones.
    std::function<std::shared_ptr<artifact::Cache>(const std::string& profile)> cache;
    // Unknown profiles are reported as usage errors before any cache is built. Unset: all accepted.
    std::function<bool(const std::string& profile)> hasProfile;
    std::function<nlohmann::json()> effectiveConfig;
};

void registerAllCommands(Router& router, const CommandContext& ctx);

void registerResolveCommand(Router& router, const CommandContext& ctx);
void registerPackageCommand(Router& router, const CommandContext& ctx);
void registerPublishCommand(Router& router, const CommandContext& ctx);
void registerPathCommand(Router& router, const CommandContext& ctx);
void registerConfigCommand(Router& router, const CommandContext& ctx);
void registerHelpCommand(Router& router);

}
