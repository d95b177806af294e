#include "config/Config.hpp"
#include "config/config_yaml.hpp"
#include "runtime/Environment.hpp"
#include "util/errors.hpp"

#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>
#include <fmt/core.h>

namespace vc::config {

std::map<std::string, CacheProfileConfig> Config::defaultProfiles() {
    CacheProfileConfig clones;
    clones.cache_dir.subdir = ".tc-vcs/clones";

    CacheProfileConfig repo;
    repo.cache_dir.subdir = ".tc-vcs-repo/sources";

    return {{"clones", clones}, {"repo", repo}};
}

const CacheProfileConfig& Config::profile(const std::string& name) const {
    const auto it = caches.find(name);
    if (it == caches.end()) throw PreconditionError(fmt::format("Unknown cache profile '{}'", name));
    return it->second;
}

template <typename T>
static void decodeSection(const YAML::Node& node, const std::string& name, T& out) {
    if (!YAML::convert<T>::decode(node, out)) throw std::runtime_error(fmt::format("'{}' must be a mapping", name));
}

static Config decodeRoot(const YAML::Node& root) {
    Config cfg;
    if (!root || root.IsNull()) return cfg;
    if (!root.IsMap()) throw std::runtime_error("Config root must be a mapping");

    if (auto node = root["caches"]) {
        if (!node.IsMap()) throw std::runtime_error("'caches' must be a mapping of profile name to layout");
        for (const auto& kv : node) {
            const auto name = kv.first.as<std::string>();
            CacheProfileConfig profile = cfg.caches.contains(name) ? cfg.caches.at(name) : CacheProfileConfig{};
            decodeSection(kv.second, "caches." + name, profile);
            cfg.caches[name] = profile;
        }
    }
    if (auto node = root["transfer"]) decodeSection(node, "transfer", cfg.transfer);
    if (auto node = root["archive"]) decodeSection(node, "archive", cfg.archive);
    if (auto node = root["taskcluster"]) decodeSection(node, "taskcluster", cfg.taskcluster);
    if (auto node = root["logging"]) decodeSection(node, "logging", cfg.logging);

    if (cfg.transfer.download_attempts == 0 || cfg.transfer.upload_attempts == 0)
        throw std::runtime_error("transfer attempt budgets must be at least 1");

    return cfg;
}

Config loadConfig(const std::filesystem::path& path) {
    return decodeRoot(YAML::LoadFile(path.string()));
}

Config loadConfigFromString(const std::string& yaml) {
    return decodeRoot(YAML::Load(yaml));
}

void applyEnvironmentOverrides(Config& cfg, const runtime::Environment& env) {
    if (auto url = env.get("TASKCLUSTER_ROOT_URL")) cfg.taskcluster.root_url = std::move(*url);
    if (auto id = env.get("TASKCLUSTER_CLIENT_ID")) cfg.taskcluster.client_id = std::move(*id);
    if (auto token = env.get("TASKCLUSTER_ACCESS_TOKEN")) cfg.taskcluster.access_token = std::move(*token);
    if (auto cert = env.get("TASKCLUSTER_CERTIFICATE")) cfg.taskcluster.certificate = std::move(*cert);
}

Config loadEffectiveConfig(const std::filesystem::path& path, const bool required, const runtime::Environment& env) {
    Config cfg;
    if (std::filesystem::exists(path)) cfg = loadConfig(path);
    else if (required) throw std::runtime_error(fmt::format("Config file '{}' does not exist", path.string()));

    applyEnvironmentOverrides(cfg, env);
    return cfg;
}

void to_json(nlohmann::json& j, const CacheProfileConfig& c) {
    j = {
        {"cache_dir", {
            {"env", c.cache_dir.env},
            {"root", c.cache_dir.root.string()},
            {"subdir", c.cache_dir.subdir.string()}
        }},
        {"cache_name", {
            {"prefix", c.cache_name.prefix},
            {"suffix", c.cache_name.suffix}
        }}
    };
}

void to_json(nlohmann::json& j, const TransferConfig& c) {
    j = {
        {"download_attempts", c.download_attempts},
        {"upload_attempts", c.upload_attempts},
        {"retry_delay_ms", c.retry_delay.count()},
        {"connect_timeout_seconds", c.connect_timeout.count()},
        {"low_speed_limit_bytes", c.low_speed_limit_bytes},
        {"low_speed_time_seconds", c.low_speed_time.count()}
    };
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"caches", c.caches},
        {"transfer", c.transfer},
        {"archive", {{"tar_path", c.archive.tar_path}}},
        {"taskcluster", {
            {"root_url", c.taskcluster.root_url},
            {"client_id", c.taskcluster.client_id},
            {"access_token", c.taskcluster.access_token.empty() ? "" : "<redacted>"}
        }},
        {"logging", {{"log_dir", c.logging.log_dir.string()}}}
    };
}

} // namespace vc::config
