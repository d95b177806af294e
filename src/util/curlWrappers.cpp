#include "util/curlWrappers.hpp"

#include <cctype>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace vc::util {

void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

size_t writeToString(const char* ptr, const size_t size, const size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

std::string urlEncode(const std::string_view s) {
    std::ostringstream out;
    out << std::uppercase << std::hex;
    for (const unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') out << c;
        else out << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
    }
    return out.str();
}

}
