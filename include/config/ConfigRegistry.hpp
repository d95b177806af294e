#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <mutex>

namespace vc::config {

class ConfigRegistry {
public:
    // See loadEffectiveConfig(). Only the first init() of the process takes effect.
    static void init(const std::filesystem::path& path, const runtime::Environment& env, bool required = false);
    static void init(const Config& config);
    static const Config& get();

    [[nodiscard]] static bool isInitialized();

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline bool initialized_ = false;
    static inline std::once_flag init_flag_;
};

} // namespace vc::config
