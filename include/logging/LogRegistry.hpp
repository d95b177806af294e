#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace vc::config { struct LoggingConfig; }

namespace vc::logging {

class LogRegistry {
public:
    // Initialize all loggers with sinks/levels.
    static void init(const config::LoggingConfig& cnf);

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> vcscache() { return get("vcscache"); }
    static std::shared_ptr<spdlog::logger> cache()    { return get("cache"); }
    static std::shared_ptr<spdlog::logger> transfer() { return get("transfer"); }
    static std::shared_ptr<spdlog::logger> archive()  { return get("archive"); }
    static std::shared_ptr<spdlog::logger> index()    { return get("index"); }
    static std::shared_ptr<spdlog::logger> storage()  { return get("storage"); }
    static std::shared_ptr<spdlog::logger> shell()    { return get("shell"); }

    [[nodiscard]] static bool isInitialized();

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;

    static inline std::filesystem::path main_log_path_;

    // stderr so that command output on stdout stays machine readable
    static inline std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;

    static inline size_t main_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t main_max_files_ = 5;
};

}
