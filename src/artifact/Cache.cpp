#include "artifact/Cache.hpp"
#include "archive/Archiver.hpp"
#include "runtime/Environment.hpp"
#include "storage/Client.hpp"
#include "transfer/Engine.hpp"
#include "logging/LogRegistry.hpp"
#include "util/errors.hpp"

#include <fmt/core.h>

using namespace vc::artifact;
using namespace vc::logging;
using namespace vc::util;

namespace {

void removeAll(const fs::path& p) {
    std::error_code ec;
    fs::remove_all(p, ec);
    if (ec) LogRegistry::cache()->warn("[Cache] failed to remove {}: {}", p.string(), ec.message());
}

template <typename Fn>
decltype(auto) stage(const char* name, const std::string& subject, Fn&& fn) {
    try {
        return fn();
    } catch (const std::exception& e) {
        LogRegistry::cache()->error("[Cache] stage {} failed for {}: {}", name, subject, e.what());
        throw;
    }
}

}

Cache::Cache(PathResolver paths,
             std::shared_ptr<index::Client> index,
             std::shared_ptr<storage::Client> storage,
             std::shared_ptr<const transfer::Engine> transfer,
             std::shared_ptr<const archive::Archiver> archiver,
             std::shared_ptr<const runtime::Environment> env)
    : paths_(std::move(paths)),
      index_(std::move(index)),
      storage_(std::move(storage)),
      transfer_(std::move(transfer)),
      archiver_(std::move(archiver)),
      env_(std::move(env)) {
    if (!index_ || !storage_ || !transfer_ || !archiver_ || !env_)
        throw std::invalid_argument("artifact::Cache requires index, storage, transfer, archiver and environment");
}

bool Cache::extractLocal(const fs::path& localPath, const fs::path& destination) const {
    try {
        archiver_->extract(localPath, destination);
        return true;
    } catch (const ExtractError& e) {
        LogRegistry::cache()->warn("[Cache] stage local-extract failed, discarding {} and re-downloading: {}",
                                   localPath.string(), e.what());
        removeAll(localPath);
        removeAll(destination);
        return false;
    }
}

bool Cache::resolve(const std::string& name, const std::string& ns, const fs::path& destination) const {
    const auto localPath = paths_.localPath(name);

    if (fs::exists(localPath) && extractLocal(localPath, destination)) {
        LogRegistry::cache()->info("[Cache] local hit for {} at {}", name, localPath.string());
        return true;
    }

    const auto url = stage("index-lookup", ns, [&] { return lookupRemote(ns, PathResolver::storageName(name)); });
    if (!url) {
        LogRegistry::cache()->info("[Cache] no artifact for {} under {}", name, ns);
        return false;
    }

    stage("download", *url, [&] { transfer_->download(*url, localPath); });
    stage("remote-extract", localPath.string(), [&] { archiver_->extract(localPath, destination); });

    LogRegistry::cache()->info("[Cache] remote hit for {} under {}", name, ns);
    return true;
}

std::optional<std::string> Cache::lookupRemote(const std::string& ns, const std::string& storageName) const {
    const auto record = index_->find(ns);
    if (!record) return std::nullopt;
    return storage_->buildRetrievalUrl(record->taskId, storageName);
}

vc::index::Record Cache::publish(const std::string& name, const std::string& ns, const PublishOptions& options) const {
    const auto localPath = paths_.localPath(name);
    if (!fs::exists(localPath))
        throw PreconditionError(fmt::format("Artifact ({}) must exist locally first, run package first",
                                            localPath.string()));

    const auto now = Clock::now();
    const auto taskId = options.taskId ? *options.taskId : env_->get("TASK_ID").value_or("");
    const auto runId = options.runId ? *options.runId : env_->get("RUN_ID").value_or("");
    if (taskId.empty()) throw PreconditionError("publish requires a task id (--task-id or TASK_ID)");
    if (runId.empty()) throw PreconditionError("publish requires a run id (--run-id or RUN_ID)");

    index::Record record;
    record.ns = ns;
    record.taskId = taskId;
    record.expires = options.expires.value_or(now + DEFAULT_EXPIRY);
    record.rank = options.rank.value_or(toEpochMillis(now));
    record.data = nlohmann::json::object();

    const auto storageName = PathResolver::storageName(name);
    const auto destination = stage("create-destination", storageName, [&] {
        return storage_->createDestination(taskId, runId, storageName, {"s3", record.expires, "application/x-tar"});
    });

    stage("upload", localPath.string(), [&] { transfer_->upload(localPath, destination.putUrl); });
    stage("index-insert", ns, [&] { index_->insert(ns, record); });

    LogRegistry::cache()->info("[Cache] published {} as {} on task {} run {}, indexed under {} (rank {})",
                               name, storageName, taskId, runId, ns, record.rank);
    return record;
}

fs::path Cache::package(const std::string& name, const fs::path& cwd, const std::vector<std::string>& files) const {
    const auto localPath = paths_.localPath(name);
    archiver_->compress(files, cwd, localPath);
    LogRegistry::cache()->info("[Cache] packaged {} file(s) from {} into {}", files.size(), cwd.string(), localPath.string());
    return localPath;
}
