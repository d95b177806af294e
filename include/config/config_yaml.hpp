#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace vc::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<CacheDirConfig> {
    static Node encode(const CacheDirConfig& rhs) {
        Node node;
        node["env"] = rhs.env;
        node["root"] = rhs.root.string();
        node["subdir"] = rhs.subdir.string();
        return node;
    }

    static bool decode(const Node& node, CacheDirConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.env = node["env"].as<std::string>(rhs.env);
        rhs.root = node["root"].as<std::string>(rhs.root.string());
        rhs.subdir = node["subdir"].as<std::string>(rhs.subdir.string());
        return true;
    }
};

template<>
struct convert<CacheNameConfig> {
    static Node encode(const CacheNameConfig& rhs) {
        Node node;
        node["prefix"] = rhs.prefix;
        node["suffix"] = rhs.suffix;
        return node;
    }

    static bool decode(const Node& node, CacheNameConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.prefix = node["prefix"].as<std::string>(rhs.prefix);
        rhs.suffix = node["suffix"].as<std::string>(rhs.suffix);
        return true;
    }
};

template<>
struct convert<CacheProfileConfig> {
    static Node encode(const CacheProfileConfig& rhs) {
        Node node;
        node["cache_dir"] = rhs.cache_dir;
        node["cache_name"] = rhs.cache_name;
        return node;
    }

    static bool decode(const Node& node, CacheProfileConfig& rhs) {
        if (!node.IsMap()) return false;
        // decoded in place so unset keys keep the profile's own defaults
        if (const auto dir = node["cache_dir"]; dir && !convert<CacheDirConfig>::decode(dir, rhs.cache_dir)) return false;
        if (const auto name = node["cache_name"]; name && !convert<CacheNameConfig>::decode(name, rhs.cache_name)) return false;
        return true;
    }
};

template<>
struct convert<TransferConfig> {
    static Node encode(const TransferConfig& rhs) {
        Node node;
        node["download_attempts"] = rhs.download_attempts;
        node["upload_attempts"] = rhs.upload_attempts;
        node["retry_delay_ms"] = rhs.retry_delay.count();
        node["connect_timeout_seconds"] = rhs.connect_timeout.count();
        node["low_speed_limit_bytes"] = rhs.low_speed_limit_bytes;
        node["low_speed_time_seconds"] = rhs.low_speed_time.count();
        return node;
    }

    static bool decode(const Node& node, TransferConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.download_attempts = node["download_attempts"].as<unsigned int>(20);
        rhs.upload_attempts = node["upload_attempts"].as<unsigned int>(10);
        rhs.retry_delay = std::chrono::milliseconds(node["retry_delay_ms"].as<long>(0));
        rhs.connect_timeout = std::chrono::seconds(node["connect_timeout_seconds"].as<long>(30));
        rhs.low_speed_limit_bytes = node["low_speed_limit_bytes"].as<long>(500000);
        rhs.low_speed_time = std::chrono::seconds(node["low_speed_time_seconds"].as<long>(30));
        return true;
    }
};

template<>
struct convert<ArchiveConfig> {
    static Node encode(const ArchiveConfig& rhs) {
        Node node;
        node["tar_path"] = rhs.tar_path;
        return node;
    }

    static bool decode(const Node& node, ArchiveConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.tar_path = node["tar_path"].as<std::string>("tar");
        return true;
    }
};

template<>
struct convert<TaskclusterConfig> {
    static Node encode(const TaskclusterConfig& rhs) {
        Node node;
        node["root_url"] = rhs.root_url;
        node["client_id"] = rhs.client_id;
        return node;
    }

    static bool decode(const Node& node, TaskclusterConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.root_url = node["root_url"].as<std::string>("http://taskcluster");
        rhs.client_id = node["client_id"].as<std::string>("");
        rhs.access_token = node["access_token"].as<std::string>("");
        rhs.certificate = node["certificate"].as<std::string>("");
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["vcscache"] = to_std_string(spdlog::level::to_string_view(rhs.vcscache));
        node["cache"]    = to_std_string(spdlog::level::to_string_view(rhs.cache));
        node["transfer"] = to_std_string(spdlog::level::to_string_view(rhs.transfer));
        node["archive"]  = to_std_string(spdlog::level::to_string_view(rhs.archive));
        node["index"]    = to_std_string(spdlog::level::to_string_view(rhs.index));
        node["storage"]  = to_std_string(spdlog::level::to_string_view(rhs.storage));
        node["shell"]    = to_std_string(spdlog::level::to_string_view(rhs.shell));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.vcscache = spdlog::level::from_str(node["vcscache"].as<std::string>("info"));
        rhs.cache = spdlog::level::from_str(node["cache"].as<std::string>("info"));
        rhs.transfer = spdlog::level::from_str(node["transfer"].as<std::string>("info"));
        rhs.archive = spdlog::level::from_str(node["archive"].as<std::string>("info"));
        rhs.index = spdlog::level::from_str(node["index"].as<std::string>("info"));
        rhs.storage = spdlog::level::from_str(node["storage"].as<std::string>("info"));
        rhs.shell = spdlog::level::from_str(node["shell"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("debug"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("");
        if (node["levels"]) rhs.levels = node["levels"].as<LogLevelsConfig>();
        return true;
    }
};

}
