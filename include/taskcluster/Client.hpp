#pragma once

#include "taskcluster/Hawk.hpp"
#include "util/curlWrappers.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace vc::config { struct TaskclusterConfig; }

namespace vc::taskcluster {

// JSON over HTTP against a Taskcluster deployment. Requests are Hawk-signed when
// credentials are present and sent as-is otherwise (the in-task proxy signs them).
class Client {
public:
    Client(std::string rootUrl, Credentials credentials, std::chrono::seconds connectTimeout = std::chrono::seconds{30});

    static Client fromConfig(const config::TaskclusterConfig& cfg);

    // {rootUrl}/api/{service}/{version}
    [[nodiscard]] std::string serviceUrl(const std::string& service, const std::string& version = "v1") const;

    // Transport-level failures (no HTTP status) raise UpstreamError with status 0.
    // HTTP errors are returned to the caller, which decides what a miss looks like.
    [[nodiscard]] util::HttpResponse request(const std::string& method, const std::string& url,
                                             const std::optional<nlohmann::json>& body = std::nullopt) const;

    [[nodiscard]] const std::string& rootUrl() const { return rootUrl_; }
    [[nodiscard]] bool signsRequests() const { return !credentials_.empty(); }

private:
    std::string rootUrl_;
    Credentials credentials_;
    std::chrono::seconds connectTimeout_;
};

}
