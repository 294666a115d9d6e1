#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace nb::config {

constexpr static uintmax_t MAX_BODY_SIZE_BYTES = 1024 * 1024; // 1MB

struct HttpServerConfig {
    std::string host = "127.0.0.1";
    uint16_t port = 8000;
    unsigned int threads = 4;
    uintmax_t max_body_size_bytes = MAX_BODY_SIZE_BYTES;
};

struct CorsConfig {
    std::vector<std::string> allowed_origins = {
        "http://localhost",
        "http://localhost:3000",
        "http://127.0.0.1",
        "http://127.0.0.1:3000",
        "https://localhost",
        "https://127.0.0.1",
    };
};

struct NotesConfig {
    unsigned int default_page_size = 10;
    unsigned int max_page_size = 100;
    unsigned int max_title_length = 200;
    unsigned int default_seed_count = 5;
    unsigned int max_seed_count = 100;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum notes = spdlog::level::info;  // Startup, shutdown, service lifecycle
    spdlog::level::level_enum http  = spdlog::level::info;  // Requests, 4xx/5xx, socket errors
    spdlog::level::level_enum store = spdlog::level::info;  // Store mutations
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir = "/var/log/notes_backend";
    LogLevelsConfig levels;
};

struct Config {
    HttpServerConfig http_server;
    CorsConfig cors;
    NotesConfig notes;
    LoggingConfig logging;
};

Config loadConfig(const std::filesystem::path& path);

} // namespace nb::config
