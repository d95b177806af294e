#include "taskcluster/Hawk.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <random>
#include <stdexcept>
#include <vector>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>
#include <fmt/core.h>
#include <nlohmann/json.hpp>

namespace vc::taskcluster {

std::string base64Encode(const std::string& raw) {
    std::vector<unsigned char> out(4 * ((raw.size() + 2) / 3) + 1);
    const int n = EVP_EncodeBlock(out.data(), reinterpret_cast<const unsigned char*>(raw.data()),
                                  static_cast<int>(raw.size()));
    return {reinterpret_cast<const char*>(out.data()), static_cast<size_t>(n)};
}

std::string hmacSha256Base64(const std::string& key, const std::string& data) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    unsigned int len = 0;
    if (!HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
              reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest, &len))
        throw std::runtime_error("HMAC-SHA256 failed");
    return base64Encode({reinterpret_cast<char*>(digest), len});
}

std::string hawkNormalizedString(const HawkRequest& req, const std::int64_t ts, const std::string& nonce,
                                 const std::string& ext) {
    std::string host = req.host;
    std::ranges::transform(host, host.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });

    // payload hash is left empty: bodies are not covered by the MAC
    return fmt::format("hawk.1.header\n{}\n{}\n{}\n{}\n{}\n{}\n\n{}\n",
                       ts, nonce, req.method, req.resource, host, req.port, ext);
}

static std::string makeNonce(const size_t length = 8) {
    static constexpr char charset[] =
        "0123456789"
        "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
        "abcdefghijklmnopqrstuvwxyz";
    thread_local std::mt19937 rng{std::random_device{}()};
    thread_local std::uniform_int_distribution<> dist(0, sizeof(charset) - 2);

    std::string result;
    result.reserve(length);
    for (size_t i = 0; i < length; ++i) result += charset[dist(rng)];
    return result;
}

std::string hawkHeader(const Credentials& creds, const HawkRequest& req, const std::int64_t ts, const std::string& nonce) {
    if (creds.empty()) throw std::invalid_argument("Hawk signing requires a client id and access token");

    std::string ext;
    if (!creds.certificate.empty()) {
        const auto certificate = nlohmann::json::parse(creds.certificate);
        ext = base64Encode(nlohmann::json{{"certificate", certificate}}.dump());
    }

    const auto mac = hmacSha256Base64(creds.accessToken, hawkNormalizedString(req, ts, nonce, ext));

    auto header = fmt::format(R"(Hawk id="{}", ts="{}", nonce="{}")", creds.clientId, ts, nonce);
    if (!ext.empty()) header += fmt::format(R"(, ext="{}")", ext);
    header += fmt::format(R"(, mac="{}")", mac);
    return header;
}

std::string hawkHeader(const Credentials& creds, const HawkRequest& req) {
    const auto ts = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return hawkHeader(creds, req, ts, makeNonce());
}

HawkRequest hawkRequestFor(const std::string& method, const std::string& url) {
    HawkRequest req;
    req.method = method;

    const auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) throw std::invalid_argument("Not an absolute URL: " + url);
    const auto scheme = url.substr(0, schemeEnd);
    req.port = scheme == "https" ? 443 : 80;

    const auto authorityStart = schemeEnd + 3;
    const auto pathStart = url.find('/', authorityStart);
    auto authority = url.substr(authorityStart, pathStart == std::string::npos ? std::string::npos : pathStart - authorityStart);
    req.resource = pathStart == std::string::npos ? "/" : url.substr(pathStart);

    if (const auto colon = authority.rfind(':'); colon != std::string::npos) {
        req.port = static_cast<uint16_t>(std::stoi(authority.substr(colon + 1)));
        authority.resize(colon);
    }
    req.host = authority;
    return req;
}

}
