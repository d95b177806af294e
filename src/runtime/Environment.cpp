#include "runtime/Environment.hpp"

#include <cstdlib>

using namespace vc::runtime;

std::optional<std::string> ProcessEnvironment::get(const std::string& name) const {
    const char* v = std::getenv(name.c_str());
    if (!v || !*v) return std::nullopt;
    return std::string(v);
}

std::optional<std::string> StaticEnvironment::get(const std::string& name) const {
    const auto it = vars_.find(name);
    if (it == vars_.end() || it->second.empty()) return std::nullopt;
    return it->second;
}
