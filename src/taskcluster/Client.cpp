#include "taskcluster/Client.hpp"
#include "config/Config.hpp"
#include "util/errors.hpp"

#include <fmt/core.h>
#include <nlohmann/json.hpp>

using namespace vc::taskcluster;
using namespace vc::util;

Client::Client(std::string rootUrl, Credentials credentials, const std::chrono::seconds connectTimeout)
    : rootUrl_(std::move(rootUrl)), credentials_(std::move(credentials)), connectTimeout_(connectTimeout) {
    while (!rootUrl_.empty() && rootUrl_.back() == '/') rootUrl_.pop_back();
    if (rootUrl_.empty()) throw PreconditionError("Taskcluster root URL must not be empty");
}

Client Client::fromConfig(const config::TaskclusterConfig& cfg) {
    return {cfg.root_url, {cfg.client_id, cfg.access_token, cfg.certificate}};
}

std::string Client::serviceUrl(const std::string& service, const std::string& version) const {
    return fmt::format("{}/api/{}/{}", rootUrl_, service, version);
}

HttpResponse Client::request(const std::string& method, const std::string& url,
                             const std::optional<nlohmann::json>& body) const {
    SList hdrs;
    hdrs.add("Accept: application/json");
    if (body) hdrs.add("Content-Type: application/json");
    if (signsRequests()) hdrs.add("Authorization: " + hawkHeader(credentials_, hawkRequestFor(method, url)));

    const std::string payload = body ? body->dump() : std::string{};

    auto resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
        curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, static_cast<long>(connectTimeout_.count()));
        if (method == "GET") {
            curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
        } else {
            curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, method.c_str());
            curl_easy_setopt(h, CURLOPT_POSTFIELDS, payload.c_str());
            curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(payload.size()));
        }
    });

    if (resp.curl != CURLE_OK)
        throw UpstreamError(fmt::format("{} {} failed: {}", method, url, resp.error), 0);

    return resp;
}
