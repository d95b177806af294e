#include "index/TaskclusterIndex.hpp"
#include "logging/LogRegistry.hpp"
#include "util/errors.hpp"

#include <fmt/core.h>

using namespace vc::index;
using namespace vc::logging;

TaskclusterIndex::TaskclusterIndex(taskcluster::Client api) : api_(std::move(api)) {}

std::string TaskclusterIndex::taskUrl(const std::string& ns) const {
    return fmt::format("{}/task/{}", api_.serviceUrl("index"), util::urlEncode(ns));
}

std::optional<Record> TaskclusterIndex::find(const std::string& ns) const {
    const auto url = taskUrl(ns);
    const auto resp = api_.request("GET", url);

    if (resp.notFound()) {
        LogRegistry::index()->debug("[TaskclusterIndex] no record under {}", ns);
        return std::nullopt;
    }

    if (!resp.ok()) {
        LogRegistry::index()->error("[TaskclusterIndex] lookup of {} failed with HTTP {}", ns, resp.http);
        throw UpstreamError(fmt::format("Index lookup for {} failed with HTTP {}", ns, resp.http), resp.http, resp.body);
    }

    try {
        auto record = nlohmann::json::parse(resp.body).get<Record>();
        if (record.ns.empty()) record.ns = ns;
        LogRegistry::index()->debug("[TaskclusterIndex] {} -> task {} (rank {})", ns, record.taskId, record.rank);
        return record;
    } catch (const std::exception& e) {
        throw UpstreamError(fmt::format("Malformed index record for {}: {}", ns, e.what()), resp.http, resp.body);
    }
}

void TaskclusterIndex::insert(const std::string& ns, const Record& record) {
    const auto resp = api_.request("PUT", taskUrl(ns), nlohmann::json(record));

    if (!resp.ok()) {
        LogRegistry::index()->error("[TaskclusterIndex] insert of {} failed with HTTP {}", ns, resp.http);
        throw UpstreamError(fmt::format("Index insert for {} failed with HTTP {}", ns, resp.http), resp.http, resp.body);
    }

    LogRegistry::index()->info("[TaskclusterIndex] indexed task {} under {} (rank {})", record.taskId, ns, record.rank);
}
