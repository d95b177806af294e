#pragma once

#include <cstdint>
#include <string>

namespace vc::taskcluster {

struct Credentials {
    std::string clientId;
    std::string accessToken;
    std::string certificate;  // temporary credentials only

    [[nodiscard]] bool empty() const { return clientId.empty() || accessToken.empty(); }
};

struct HawkRequest {
    std::string method;
    std::string host;
    uint16_t port = 443;
    std::string resource;  // path plus query
};

std::string base64Encode(const std::string& raw);
std::string hmacSha256Base64(const std::string& key, const std::string& data);

// Hawk 1 header normalized string, see https://github.com/mozilla/hawk
std::string hawkNormalizedString(const HawkRequest& req, std::int64_t ts, const std::string& nonce, const std::string& ext);

// Value of the Authorization header. `ts`/`nonce` are explicit for reproducible signatures.
std::string hawkHeader(const Credentials& creds, const HawkRequest& req, std::int64_t ts, const std::string& nonce);
std::string hawkHeader(const Credentials& creds, const HawkRequest& req);

// Splits an absolute http(s) URL into the pieces Hawk signs.
HawkRequest hawkRequestFor(const std::string& method, const std::string& url);

}
