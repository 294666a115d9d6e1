#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <mutex>

namespace nb::config {

static const std::filesystem::path DEFAULT_CONFIG_PATH = "/etc/notes_backend/config.yaml";

class ConfigRegistry {
public:
    // Loads the file once; later calls are ignored.
    static void init(const std::filesystem::path& path = DEFAULT_CONFIG_PATH);

    // Installs an already built config (defaults or tests).
    static void init(Config config);

    static const Config& get();

    [[nodiscard]] static bool isInitialized();

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline bool initialized_ = false;
    static inline std::once_flag init_flag_;
};

} // namespace nb::config
