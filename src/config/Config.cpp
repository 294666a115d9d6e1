#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace nb::config {

namespace {

template <typename T>
void decodeSection(const YAML::Node& root, const char* key, T& out) {
    const auto node = root[key];
    if (!node || node.IsNull()) return;
    if (!YAML::convert<T>::decode(node, out))
        throw std::runtime_error(std::string("section '") + key + "' must be a mapping");
}

}

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    YAML::Node root;

    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to load config " + path.string() + ": " + e.what());
    }

    try {
        decodeSection(root, "http_server", cfg.http_server);
        decodeSection(root, "cors", cfg.cors);
        decodeSection(root, "notes", cfg.notes);
        decodeSection(root, "logging", cfg.logging);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Invalid config " + path.string() + ": " + e.what());
    } catch (const std::runtime_error& e) {
        throw std::runtime_error("Invalid config " + path.string() + ": " + e.what());
    }

    if (cfg.http_server.threads == 0) throw std::runtime_error("Invalid config: http_server.threads must be at least 1");
    if (cfg.notes.max_page_size == 0) throw std::runtime_error("Invalid config: notes.max_page_size must be at least 1");
    if (cfg.notes.max_seed_count == 0) throw std::runtime_error("Invalid config: notes.max_seed_count must be at least 1");
    if (cfg.notes.default_page_size == 0 || cfg.notes.default_page_size > cfg.notes.max_page_size)
        throw std::runtime_error("Invalid config: notes.default_page_size must be between 1 and notes.max_page_size");
    if (cfg.notes.default_seed_count == 0 || cfg.notes.default_seed_count > cfg.notes.max_seed_count)
        throw std::runtime_error("Invalid config: notes.default_seed_count must be between 1 and notes.max_seed_count");
    if (cfg.notes.max_title_length == 0) throw std::runtime_error("Invalid config: notes.max_title_length must be at least 1");

    return cfg;
}

} // namespace nb::config
