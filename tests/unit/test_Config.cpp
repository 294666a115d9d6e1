#include <gtest/gtest.h>
#include "config/Config.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;
using namespace nb::config;

class ConfigTest : public ::testing::Test {
protected:
    fs::path dir;

    void SetUp() override {
        dir = fs::temp_directory_path() / ("nb_config_" + std::string(
            ::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::create_directories(dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    fs::path write(const std::string& yaml) const {
        const auto path = dir / "config.yaml";
        std::ofstream(path) << yaml;
        return path;
    }
};

TEST_F(ConfigTest, DefaultsMatchDocumentedValues) {
    const Config cfg;
    EXPECT_EQ(cfg.http_server.host, "127.0.0.1");
    EXPECT_EQ(cfg.http_server.port, 8000);
    EXPECT_EQ(cfg.http_server.max_body_size_bytes, MAX_BODY_SIZE_BYTES);
    EXPECT_EQ(cfg.cors.allowed_origins.size(), 6u);
    EXPECT_EQ(cfg.notes.default_page_size, 10u);
    EXPECT_EQ(cfg.notes.max_page_size, 100u);
    EXPECT_EQ(cfg.notes.default_seed_count, 5u);
}

TEST_F(ConfigTest, EmptyFileYieldsDefaults) {
    const auto cfg = loadConfig(write(""));
    EXPECT_EQ(cfg.http_server.port, 8000);
    EXPECT_EQ(cfg.notes.max_title_length, 200u);
    EXPECT_EQ(cfg.logging.log_dir.string(), "/var/log/notes_backend");
}

TEST_F(ConfigTest, OverridesAreApplied) {
    const auto cfg = loadConfig(write(R"(
http_server:
  host: 0.0.0.0
  port: 9001
  threads: 2
  max_body_size_mb: 4
cors:
  allowed_origins:
    - http://example.test
notes:
  default_page_size: 20
  max_seed_count: 10
logging:
  log_dir: /tmp/nb-logs
  log_levels:
    console_log_level: warn
    subsystem_levels:
      http: debug
)"));

    EXPECT_EQ(cfg.http_server.host, "0.0.0.0");
    EXPECT_EQ(cfg.http_server.port, 9001);
    EXPECT_EQ(cfg.http_server.threads, 2u);
    EXPECT_EQ(cfg.http_server.max_body_size_bytes, 4u * 1024 * 1024);
    ASSERT_EQ(cfg.cors.allowed_origins.size(), 1u);
    EXPECT_EQ(cfg.cors.allowed_origins[0], "http://example.test");
    EXPECT_EQ(cfg.notes.default_page_size, 20u);
    EXPECT_EQ(cfg.notes.max_page_size, 100u);
    EXPECT_EQ(cfg.notes.max_seed_count, 10u);
    EXPECT_EQ(cfg.logging.log_dir.string(), "/tmp/nb-logs");
    EXPECT_EQ(cfg.logging.levels.console_log_level, spdlog::level::warn);
    EXPECT_EQ(cfg.logging.levels.file_log_level, spdlog::level::debug);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.http, spdlog::level::debug);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.store, spdlog::level::info);
}

TEST_F(ConfigTest, MissingFileThrows) {
    EXPECT_THROW(loadConfig(dir / "absent.yaml"), std::runtime_error);
}

TEST_F(ConfigTest, MalformedValuesThrow) {
    EXPECT_THROW(loadConfig(write("just a scalar\n")), std::runtime_error);
    EXPECT_THROW(loadConfig(write("notes: [1, 2]\n")), std::runtime_error);
}

TEST_F(ConfigTest, ZeroThreadsIsRejected) {
    EXPECT_THROW(loadConfig(write("http_server:\n  threads: 0\n")), std::runtime_error);
}

TEST_F(ConfigTest, DefaultsMustFitTheirCaps) {
    EXPECT_THROW(loadConfig(write("notes:\n  default_seed_count: 50\n  max_seed_count: 10\n")), std::runtime_error);
    EXPECT_THROW(loadConfig(write("notes:\n  default_page_size: 0\n")), std::runtime_error);
    EXPECT_THROW(loadConfig(write("notes:\n  default_page_size: 200\n")), std::runtime_error);
    EXPECT_THROW(loadConfig(write("notes:\n  max_title_length: 0\n")), std::runtime_error);
    EXPECT_NO_THROW(loadConfig(write("notes:\n  default_seed_count: 10\n  max_seed_count: 10\n")));
}
