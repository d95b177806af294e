#include "logging/LogRegistry.hpp"
#include "config/Config.hpp"

#include <filesystem>
#include <stdexcept>
#include <vector>

namespace vc::logging {

void LogRegistry::init(const config::LoggingConfig& cnf) {
    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    std::vector<spdlog::sink_ptr> sinks;

    console_sink_ = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink_->set_level(cnf.levels.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);
    sinks.push_back(console_sink_);

    if (!cnf.log_dir.empty()) {
        namespace fs = std::filesystem;
        if (!fs::exists(cnf.log_dir)) fs::create_directories(cnf.log_dir);
        main_log_path_ = cnf.log_dir / "vcscache.log";

        main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            main_log_path_.string(), main_max_bytes_, main_max_files_);
        main_file_sink_->set_level(cnf.levels.file_log_level);
        main_file_sink_->set_pattern(LOG_FORMAT);
        sinks.push_back(main_file_sink_);
    }

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.levels.subsystem_levels;
    makeLogger("vcscache", sub_levels.vcscache);
    makeLogger("cache",    sub_levels.cache);
    makeLogger("transfer", sub_levels.transfer);
    makeLogger("archive",  sub_levels.archive);
    makeLogger("index",    sub_levels.index);
    makeLogger("storage",  sub_levels.storage);
    makeLogger("shell",    sub_levels.shell);

    initialized_ = true;
    vcscache()->debug("[LogRegistry] Initialized");
}

std::shared_ptr<spdlog::logger> LogRegistry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[LogRegistry] LogRegistry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[LogRegistry] Logger not found: " + name);
    }
    return logger;
}

bool LogRegistry::isInitialized() { return initialized_; }

}
