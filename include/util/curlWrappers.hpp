#pragma once

#include <curl/curl.h>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace vc::util {

constexpr auto USER_AGENT = "vcscache/0.1";

void ensureCurlGlobalInit();

size_t writeToString(const char* ptr, size_t size, size_t nmemb, void* userdata);

// Percent-encodes every reserved character, '/' included.
std::string urlEncode(std::string_view s);

// Owns one easy handle. Redirects are followed (the queue answers artifact
// requests with a 303 to the blob) and signals are never used for timeouts.
class CurlEasy {
public:
    CurlEasy() : h_(curl_easy_init()) {
        if (!h_) throw std::runtime_error("curl_easy_init failed");
        curl_easy_setopt(h_, CURLOPT_NOPROGRESS, 1L);
        curl_easy_setopt(h_, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(h_, CURLOPT_MAXREDIRS, 10L);
        curl_easy_setopt(h_, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(h_, CURLOPT_USERAGENT, USER_AGENT);
    }
    ~CurlEasy() { curl_easy_cleanup(h_); }

    CurlEasy(const CurlEasy&) = delete;
    CurlEasy& operator=(const CurlEasy&) = delete;

    operator CURL*() { return h_; }

private:
    CURL* h_;
};

// Header list whose strings live as long as the list.
class SList {
public:
    SList() = default;
    SList(const SList&) = delete;
    SList& operator=(const SList&) = delete;
    ~SList() { curl_slist_free_all(head_); }

    void add(std::string header) {
        owned_.push_back(std::move(header));
        head_ = curl_slist_append(head_, owned_.back().c_str());
    }

    [[nodiscard]] curl_slist* get() const { return head_; }

private:
    std::vector<std::string> owned_;
    curl_slist* head_ = nullptr;
};

struct HttpResponse {
    CURLcode curl = CURLE_OK;
    long http = 0;
    std::string body;
    std::string error;         // curl's error buffer, or its generic message
    std::string effectiveUrl;  // after redirects

    [[nodiscard]] bool ok() const { return curl == CURLE_OK && http / 100 == 2; }
    [[nodiscard]] bool notFound() const { return curl == CURLE_OK && http == 404; }
};

// Runs one request on a fresh handle. The body is collected into the response
// unless `setup` installs its own write callback.
template <class SetupFn>
HttpResponse performCurl(SetupFn&& setup) {
    ensureCurlGlobalInit();

    CurlEasy h;
    std::string body;
    char errBuf[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, writeToString);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(h, CURLOPT_ERRORBUFFER, errBuf);

    setup(static_cast<CURL*>(h));

    HttpResponse r;
    r.curl = curl_easy_perform(h);
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &r.http);

    char* effective = nullptr;
    if (curl_easy_getinfo(h, CURLINFO_EFFECTIVE_URL, &effective) == CURLE_OK && effective) r.effectiveUrl = effective;

    r.body = std::move(body);
    r.error = errBuf[0] ? std::string(errBuf) : std::string(curl_easy_strerror(r.curl));
    return r;
}

}
