#pragma once

#include <cctype>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <fmt/core.h>

namespace vc::util {

using Clock = std::chrono::system_clock;

inline std::int64_t toEpochMillis(const Clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

// ISO 8601 UTC with milliseconds, the date format of the Taskcluster APIs.
inline std::string toIso8601(const Clock::time_point tp) {
    const auto ms = toEpochMillis(tp);
    auto secs = static_cast<std::time_t>(ms / 1000);
    auto rem = ms % 1000;
    if (rem < 0) { rem += 1000; --secs; }
    std::tm tm{};
    gmtime_r(&secs, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    return oss.str() + fmt::format(".{:03d}Z", rem);
}

// Accepts "YYYY-MM-DDTHH:MM:SSZ" with or without fractional seconds.
inline Clock::time_point parseIso8601(const std::string& iso) {
    std::tm tm{};
    std::istringstream ss(iso.substr(0, 19));
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) throw std::runtime_error("Failed to parse timestamp: " + iso);

    long millis = 0;
    if (iso.size() > 20 && iso[19] == '.') {
        std::string frac;
        for (size_t i = 20; i < iso.size() && std::isdigit(static_cast<unsigned char>(iso[i])); ++i) frac += iso[i];
        frac = frac.substr(0, 3);
        while (frac.size() < 3) frac += '0';
        millis = std::stol(frac);
    }

    return Clock::from_time_t(timegm(&tm)) + std::chrono::milliseconds(millis);
}

} // namespace vc::util
