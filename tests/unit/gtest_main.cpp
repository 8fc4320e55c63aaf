#include <gtest/gtest.h>
#include <filesystem>
#include <iostream>
#include <unistd.h>

#include "config/ConfigRegistry.hpp"
#include "config/paths.hpp"
#include "logging/LogRegistry.hpp"

namespace fs = std::filesystem;

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    const auto logDir = fs::temp_directory_path() / ("hubload-tests-" + std::to_string(::getpid()));

    try {
        hl::config::Config cfg;
        cfg.logging.levels.console_log_level = spdlog::level::warn;
        cfg.logging.log_dir = logDir;

        hl::paths::setLogPathForTesting(logDir);
        hl::config::ConfigRegistry::init(cfg);
        hl::logging::LogRegistry::init(logDir);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize hubload test environment: " << e.what() << std::endl;
        return 1;
    }

    const int rc = RUN_ALL_TESTS();

    hl::logging::LogRegistry::flushAll();
    std::error_code ec;
    fs::remove_all(logDir, ec);
    return rc;
}
