#include "runtime/Deps.hpp"
#include "runtime/Environment.hpp"
#include "artifact/Cache.hpp"
#include "archive/TarArchiver.hpp"
#include "index/TaskclusterIndex.hpp"
#include "storage/TaskclusterQueue.hpp"
#include "taskcluster/Client.hpp"
#include "transfer/Engine.hpp"
#include "logging/LogRegistry.hpp"
#include "util/errors.hpp"

#include <fmt/core.h>

using namespace vc::runtime;
using namespace vc::logging;

Deps Deps::fromConfig(const config::Config& cfg, std::shared_ptr<const Environment> env) {
    if (!env) env = std::make_shared<ProcessEnvironment>();

    auto api = taskcluster::Client::fromConfig(cfg.taskcluster);
    LogRegistry::vcscache()->debug("[Deps] Taskcluster at {} ({})", api.rootUrl(),
                                   api.signsRequests() ? "signed requests" : "unsigned, proxy");

    Deps deps;
    deps.env = std::move(env);
    deps.indexClient = std::make_shared<index::TaskclusterIndex>(api);
    deps.storageClient = std::make_shared<storage::TaskclusterQueue>(api);
    deps.transferEngine = transfer::Engine::fromConfig(cfg.transfer);
    deps.archiver = std::make_shared<archive::TarArchiver>(cfg.archive.tar_path);
    deps.profiles = cfg.caches;
    return deps;
}

std::shared_ptr<vc::artifact::Cache> Deps::cache(const std::string& profile) const {
    const auto it = profiles.find(profile);
    if (it == profiles.end()) throw PreconditionError(fmt::format("Unknown cache profile: {}", profile));

    return std::make_shared<artifact::Cache>(artifact::PathResolver(it->second, env),
                                             indexClient, storageClient, transferEngine, archiver, env);
}
