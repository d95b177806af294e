#include "config/ConfigRegistry.hpp"

#include <stdexcept>

namespace vc::config {

void ConfigRegistry::init(const std::filesystem::path& path, const runtime::Environment& env, const bool required) {
    std::call_once(init_flag_, [&]() {
        config_ = loadEffectiveConfig(path, required, env);
        initialized_ = true;
    });
}

void ConfigRegistry::init(const Config& config) {
    std::call_once(init_flag_, [&]() {
        config_ = config;
        initialized_ = true;
    });
}

const Config& ConfigRegistry::get() {
    ensureInitialized();
    return config_;
}

bool ConfigRegistry::isInitialized() { return initialized_; }

void ConfigRegistry::ensureInitialized() {
    if (!initialized_)
        throw std::runtime_error("ConfigRegistry accessed before initialization. Call ConfigRegistry::init() first.");
}

} // namespace vc::config
