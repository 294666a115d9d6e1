#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace nb::config;

template<>
struct convert<HttpServerConfig> {
    static Node encode(const HttpServerConfig& rhs) {
        Node node;
        node["host"] = rhs.host;
        node["port"] = rhs.port;
        node["threads"] = rhs.threads;
        node["max_body_size_mb"] = rhs.max_body_size_bytes / (1024 * 1024);
        return node;
    }

    static bool decode(const Node& node, HttpServerConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.host = node["host"].as<std::string>("127.0.0.1");
        rhs.port = node["port"].as<uint16_t>(8000);
        rhs.threads = node["threads"].as<unsigned int>(4);
        rhs.max_body_size_bytes = node["max_body_size_mb"].as<uintmax_t>(1) * 1024 * 1024; // Default 1MB
        return true;
    }
};

template<>
struct convert<CorsConfig> {
    static Node encode(const CorsConfig& rhs) {
        Node node;
        node["allowed_origins"] = rhs.allowed_origins;
        return node;
    }

    static bool decode(const Node& node, CorsConfig& rhs) {
        if (!node.IsMap()) return false;
        if (const auto origins = node["allowed_origins"])
            rhs.allowed_origins = origins.as<std::vector<std::string>>();
        return true;
    }
};

template<>
struct convert<NotesConfig> {
    static Node encode(const NotesConfig& rhs) {
        Node node;
        node["default_page_size"] = rhs.default_page_size;
        node["max_page_size"] = rhs.max_page_size;
        node["max_title_length"] = rhs.max_title_length;
        node["default_seed_count"] = rhs.default_seed_count;
        node["max_seed_count"] = rhs.max_seed_count;
        return node;
    }

    static bool decode(const Node& node, NotesConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.default_page_size = node["default_page_size"].as<unsigned int>(10);
        rhs.max_page_size = node["max_page_size"].as<unsigned int>(100);
        rhs.max_title_length = node["max_title_length"].as<unsigned int>(200);
        rhs.default_seed_count = node["default_seed_count"].as<unsigned int>(5);
        rhs.max_seed_count = node["max_seed_count"].as<unsigned int>(100);
        return true;
    }
};

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["notes"] = to_std_string(spdlog::level::to_string_view(rhs.notes));
        node["http"]  = to_std_string(spdlog::level::to_string_view(rhs.http));
        node["store"] = to_std_string(spdlog::level::to_string_view(rhs.store));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.notes = spdlog::level::from_str(node["notes"].as<std::string>("info"));
        rhs.http = spdlog::level::from_str(node["http"].as<std::string>("info"));
        rhs.store = spdlog::level::from_str(node["store"].as<std::string>("info"));
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
        if (const auto sub = node["subsystem_levels"]) convert<SubsystemLogLevelsConfig>::decode(sub, rhs.subsystem_levels);
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("/var/log/notes_backend");
        if (const auto levels = node["log_levels"]) convert<LogLevelsConfig>::decode(levels, rhs.levels);
        return true;
    }
};

} // namespace YAML
