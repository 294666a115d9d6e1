#include "services/AsyncService.hpp"
#include "log/Registry.hpp"

#include <exception>

using namespace nb::services;
using namespace nb::log;

AsyncService::AsyncService(std::string serviceName) : serviceName_(std::move(serviceName)) {}

AsyncService::~AsyncService() {
    stop(); // ensure cleanup
}

void AsyncService::start() {
    if (isRunning()) return;

    // A previous run may have ended on its own
    if (worker_.joinable()) worker_.join();

    running_.store(true);

    worker_ = std::thread([this] {
        try {
            runLoop();
        } catch (const std::exception& e) {
            Registry::notes()->error("[{}] Service encountered an error: {}", serviceName_, e.what());
        }
        running_.store(false);
    });

    Registry::notes()->info("[{}] Service started.", serviceName_);
}

void AsyncService::stop() {
    const bool wasRunning = isRunning();
    if (wasRunning) Registry::notes()->info("[{}] Stopping service...", serviceName_);

    // Only join if we're not calling stop() from the same thread
    if (worker_.joinable() && std::this_thread::get_id() != worker_.get_id()) worker_.join();

    running_.store(false);

    if (wasRunning) Registry::notes()->info("[{}] Service stopped.", serviceName_);
}
