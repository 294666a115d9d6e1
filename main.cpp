// Services
#include "services/HttpService.hpp"

// Notes
#include "notes/Store.hpp"
#include "protocols/http/Router.hpp"
#include "protocols/http/Cors.hpp"

// Misc
#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"

// Libraries
#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <thread>

using namespace nb::config;
using namespace nb::services;
using namespace nb::notes;
using namespace nb::protocols::http;
using namespace nb::log;

namespace {
std::atomic<int> receivedSignal = 0;

void signalHandler(const int signum) {
    receivedSignal = signum;
}

void initConfig(const int argc, char* argv[]) {
    if (argc > 1) {
        ConfigRegistry::init(std::filesystem::path(argv[1]));
        return;
    }

    if (std::filesystem::exists(DEFAULT_CONFIG_PATH)) ConfigRegistry::init(DEFAULT_CONFIG_PATH);
    else ConfigRegistry::init(Config{});
}
}

int main(int argc, char* argv[]) {
    try {
        initConfig(argc, argv);
        const auto& cnf = ConfigRegistry::get();

        Registry::init(cnf.logging);
        if (argc <= 1 && !std::filesystem::exists(DEFAULT_CONFIG_PATH))
            Registry::notes()->warn("[*] No config at {}, using built-in defaults", DEFAULT_CONFIG_PATH.string());

        Registry::notes()->info("[*] Initializing notes backend...");

        const auto store = std::make_shared<Store>(cnf.notes.max_page_size);
        const auto router = std::make_shared<const Router>(store, cnf.notes, Cors(cnf.cors.allowed_origins));

        HttpService http(cnf.http_server, router);

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        http.start();
        Registry::notes()->info("[✓] Notes backend started.");

        while (receivedSignal == 0 && http.isRunning()) std::this_thread::sleep_for(std::chrono::milliseconds(200));

        if (receivedSignal != 0)
            Registry::notes()->info("[!] Signal {} received. Shutting down gracefully...", receivedSignal.load());
        else
            Registry::notes()->error("[!] HTTP service exited unexpectedly, shutting down");

        http.stop();
        Registry::notes()->info("[✓] Notes backend stopped.");
        return receivedSignal != 0 ? 0 : 1;
    } catch (const std::exception& e) {
        if (Registry::isInitialized()) Registry::notes()->critical("[!] Fatal: {}", e.what());
        else std::cerr << "[!] Fatal: " << e.what() << std::endl;
        return 1;
    }
}
