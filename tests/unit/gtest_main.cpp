#include <gtest/gtest.h>
#include <filesystem>
#include <iostream>

#include "config/Config.hpp"
#include "log/Registry.hpp"

namespace fs = std::filesystem;

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        nb::config::LoggingConfig logging;
        logging.log_dir = fs::temp_directory_path() / "notes_backend_tests";
        logging.levels.console_log_level = spdlog::level::warn;
        nb::log::Registry::init(logging);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize notes backend test environment: " << e.what() << std::endl;
        return 1;
    }

    return RUN_ALL_TESTS();
}
