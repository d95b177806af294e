#include "shell/argsHelpers.hpp"

#include <charconv>
#include <limits>

namespace vc::shell {

CommandResult invalid(std::string msg) { return {EXIT_USAGE, "", std::move(msg)}; }
CommandResult ok(std::string out) { return {EXIT_OK, std::move(out), ""}; }

std::optional<std::string> optVal(const CommandCall& c, const std::string& key) {
    for (const auto& [k, v] : c.options) if (k == key) return v.value_or(std::string{});
    return std::nullopt;
}

std::optional<std::string> optVal(const CommandCall& c, const std::vector<std::string>& keys) {
    for (const auto& k : keys) if (const auto v = optVal(c, k)) return v;
    return std::nullopt;
}

bool hasFlag(const CommandCall& c, const std::string& key) {
    for (const auto& [k, v] : c.options) if (k == key) return !v.has_value();
    return false;
}

std::optional<unsigned int> parseUInt(const std::string& sv) {
    if (sv.empty()) return std::nullopt;

    unsigned long long v = 0; // wide enough for overflow check
    for (const char c : sv) {
        if (c < '0' || c > '9') return std::nullopt;
        v = v * 10 + static_cast<unsigned>(c - '0');
        if (v > std::numeric_limits<unsigned int>::max()) {
            return std::nullopt; // overflow
        }
    }

    return static_cast<unsigned int>(v);
}

std::optional<std::int64_t> parseInt64(const std::string& sv) {
    std::int64_t v = 0;
    const auto* end = sv.data() + sv.size();
    const auto [ptr, ec] = std::from_chars(sv.data(), end, v);
    if (sv.empty() || ec != std::errc{} || ptr != end) return std::nullopt;
    return v;
}

}
