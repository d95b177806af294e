#include "transfer/CurlTransferer.hpp"
#include "logging/LogRegistry.hpp"
#include "util/curlWrappers.hpp"
#include "util/errors.hpp"

#include <fstream>
#include <fmt/core.h>

using namespace vc::transfer;
using namespace vc::logging;
using namespace vc::util;

CurlTransferer::CurlTransferer(config::TransferConfig cfg) : cfg_(std::move(cfg)) {
    ensureCurlGlobalInit();
}

void CurlTransferer::applyLimits(CURL* h) const {
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, static_cast<long>(cfg_.connect_timeout.count()));
    if (cfg_.low_speed_limit_bytes > 0) {
        curl_easy_setopt(h, CURLOPT_LOW_SPEED_LIMIT, cfg_.low_speed_limit_bytes);
        curl_easy_setopt(h, CURLOPT_LOW_SPEED_TIME, static_cast<long>(cfg_.low_speed_time.count()));
    }
}

bool CurlTransferer::isTransient(const CURLcode code, const long httpStatus) {
    if (code != CURLE_OK) {
        // Don't bother retrying when the request itself can never work
        return code != CURLE_UNSUPPORTED_PROTOCOL
            && code != CURLE_URL_MALFORMAT
            && code != CURLE_READ_ERROR
            && code != CURLE_WRITE_ERROR;
    }
    if (httpStatus / 100 == 4) return httpStatus == 408 || httpStatus == 429;
    return true;
}

void CurlTransferer::download(const std::string& url, const fs::path& destination) const {
    std::ofstream file(destination, std::ios::binary | std::ios::trunc);
    if (!file) throw TransferError("Failed to open output file for download: " + destination.string(), false);

    auto writeFn = +[](const char* ptr, const size_t size, const size_t nmemb, void* userdata) -> size_t {
        auto* fout = static_cast<std::ofstream*>(userdata);
        fout->write(ptr, static_cast<std::streamsize>(size * nmemb));
        return fout->good() ? size * nmemb : 0;
    };

    const HttpResponse resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, writeFn);
        curl_easy_setopt(h, CURLOPT_WRITEDATA, &file);
        applyLimits(h);
    });

    file.close();

    if (!resp.ok()) {
        std::error_code ec;
        fs::remove(destination, ec);
        if (ec) LogRegistry::transfer()->warn("[CurlTransferer] could not remove partial download {}: {}",
                                              destination.string(), ec.message());

        throw TransferError(
            fmt::format("GET {} failed (CURL={} HTTP={}): {}", url, static_cast<int>(resp.curl), resp.http,
                        resp.curl == CURLE_OK ? fmt::format("server returned HTTP {}", resp.http) : resp.error),
            isTransient(resp.curl, resp.http), resp.http);
    }

    if (!resp.effectiveUrl.empty() && resp.effectiveUrl != url)
        LogRegistry::transfer()->debug("[CurlTransferer] {} redirected to {}", url, resp.effectiveUrl);
    LogRegistry::transfer()->debug("[CurlTransferer] downloaded {} -> {}", url, destination.string());
}

void CurlTransferer::upload(const fs::path& source, const std::string& url) const {
    std::ifstream fin(source, std::ios::binary);
    if (!fin) throw TransferError("Failed to open file for upload: " + source.string(), false);

    const auto size = static_cast<curl_off_t>(fs::file_size(source));

    SList hdrs;
    hdrs.add(fmt::format("Content-Type: {}", CONTENT_TYPE));
    hdrs.add(fmt::format("Content-Encoding: {}", CONTENT_ENCODING));

    const HttpResponse resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_UPLOAD, 1L);
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
        curl_easy_setopt(h, CURLOPT_READDATA, &fin);
        curl_easy_setopt(h, CURLOPT_INFILESIZE_LARGE, size);
        curl_easy_setopt(h, CURLOPT_READFUNCTION,
            +[](char* buf, const size_t sz, const size_t nm, void* ud) -> size_t {
                auto* fp = static_cast<std::ifstream*>(ud);
                fp->read(buf, static_cast<std::streamsize>(sz * nm));
                return static_cast<size_t>(fp->gcount());
            });
        applyLimits(h);
    });

    if (!resp.ok()) throw TransferError(
        fmt::format("PUT {} failed (CURL={} HTTP={}): {}", source.string(), static_cast<int>(resp.curl), resp.http,
                    resp.curl == CURLE_OK ? resp.body : resp.error),
        isTransient(resp.curl, resp.http), resp.http);

    LogRegistry::transfer()->debug("[CurlTransferer] uploaded {} ({} bytes)", source.string(), size);
}
