#include <gtest/gtest.h>
#include <iostream>

#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        vc::config::Config cfg;
        cfg.logging.levels.console_log_level = spdlog::level::warn;
        vc::config::ConfigRegistry::init(cfg);
        vc::logging::LogRegistry::init(vc::config::ConfigRegistry::get().logging);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize vcscache test environment: " << e.what() << std::endl;
        return 1;
    }

    return RUN_ALL_TESTS();
}
