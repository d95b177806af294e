#include "storage/TaskclusterQueue.hpp"
#include "logging/LogRegistry.hpp"
#include "util/errors.hpp"

#include <fmt/core.h>
#include <nlohmann/json.hpp>

using namespace vc::storage;
using namespace vc::logging;
using namespace vc::util;

TaskclusterQueue::TaskclusterQueue(taskcluster::Client api) : api_(std::move(api)) {}

Destination TaskclusterQueue::createDestination(const std::string& taskId, const std::string& runId,
                                                const std::string& storageName,
                                                const DestinationOptions& opts) {
    const auto url = fmt::format("{}/task/{}/runs/{}/artifacts/{}", api_.serviceUrl("queue"),
                                 urlEncode(taskId), urlEncode(runId), urlEncode(storageName));

    const nlohmann::json body = {
        {"storageType", opts.storageType},
        {"expires", toIso8601(opts.expires)},
        {"contentType", opts.contentType}
    };

    const auto resp = api_.request("POST", url, body);
    if (!resp.ok()) {
        LogRegistry::storage()->error("[TaskclusterQueue] createArtifact {} for {}/{} failed with HTTP {}",
                                      storageName, taskId, runId, resp.http);
        throw UpstreamError(fmt::format("createArtifact {} failed with HTTP {}", storageName, resp.http),
                            resp.http, resp.body);
    }

    Destination dest;
    try {
        const auto j = nlohmann::json::parse(resp.body);
        dest.putUrl = j.at("putUrl").get<std::string>();
    } catch (const std::exception& e) {
        throw UpstreamError(fmt::format("Malformed createArtifact response for {}: {}", storageName, e.what()),
                            resp.http, resp.body);
    }

    LogRegistry::storage()->debug("[TaskclusterQueue] destination registered for {} on {}/{}", storageName, taskId, runId);
    return dest;
}

std::string TaskclusterQueue::buildRetrievalUrl(const std::string& taskId, const std::string& storageName) const {
    return fmt::format("{}/task/{}/artifacts/{}", api_.serviceUrl("queue"), urlEncode(taskId), urlEncode(storageName));
}
