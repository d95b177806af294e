#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace vc::runtime { struct Environment; }

namespace vc::config {

constexpr static auto DEFAULT_CONFIG_PATH = "/etc/vcscache/config.yaml";
constexpr static auto DEFAULT_PROFILE = "clones";

// Root is taken from the environment variable `env` when it is set, else from `root`.
struct CacheDirConfig {
    std::string env = "HOME";
    std::filesystem::path root;
    std::filesystem::path subdir = ".tc-vcs/clones";
};

// Local file name is prefix + <artifact name> + suffix.
struct CacheNameConfig {
    std::string prefix;
    std::string suffix = ".tar.gz";
};

struct CacheProfileConfig {
    CacheDirConfig cache_dir;
    CacheNameConfig cache_name;
};

struct TransferConfig {
    unsigned int download_attempts = 20;
    unsigned int upload_attempts = 10;
    std::chrono::milliseconds retry_delay{0};
    std::chrono::seconds connect_timeout{30};
    long low_speed_limit_bytes = 500000;
    std::chrono::seconds low_speed_time{30};
};

struct ArchiveConfig {
    std::string tar_path = "tar";
};

struct TaskclusterConfig {
    std::string root_url = "http://taskcluster";
    std::string client_id;
    std::string access_token;
    std::string certificate;

    [[nodiscard]] bool hasCredentials() const { return !client_id.empty() && !access_token.empty(); }
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum vcscache = spdlog::level::info;   // CLI lifecycle
    spdlog::level::level_enum cache    = spdlog::level::info;   // hits, misses, corruption fallbacks
    spdlog::level::level_enum transfer = spdlog::level::info;   // retries and exhaustion
    spdlog::level::level_enum archive  = spdlog::level::info;   // tar failures
    spdlog::level::level_enum index    = spdlog::level::info;
    spdlog::level::level_enum storage  = spdlog::level::info;
    spdlog::level::level_enum shell    = spdlog::level::warn;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir;  // empty: console only
    LogLevelsConfig levels;
};

struct Config {
    std::map<std::string, CacheProfileConfig> caches = defaultProfiles();
    TransferConfig transfer;
    ArchiveConfig archive;
    TaskclusterConfig taskcluster;
    LoggingConfig logging;

    [[nodiscard]] const CacheProfileConfig& profile(const std::string& name) const;

    static std::map<std::string, CacheProfileConfig> defaultProfiles();
};

Config loadConfig(const std::filesystem::path& path);
Config loadConfigFromString(const std::string& yaml);

// TASKCLUSTER_* variables win over the file so credentials never have to be written to disk.
void applyEnvironmentOverrides(Config& cfg, const runtime::Environment& env);

// Loads `path` and applies environment overrides. A missing file yields the built-in
// defaults unless `required` is set, in which case it is an error.
Config loadEffectiveConfig(const std::filesystem::path& path, bool required, const runtime::Environment& env);

void to_json(nlohmann::json& j, const Config& c);
void to_json(nlohmann::json& j, const CacheProfileConfig& c);
void to_json(nlohmann::json& j, const TransferConfig& c);

} // namespace vc::config
