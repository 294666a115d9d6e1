#pragma once

#include <atomic>
#include <string>
#include <thread>

namespace nb::services {

class AsyncService {
public:
    explicit AsyncService(std::string serviceName);

    virtual ~AsyncService();

    virtual void start();

    virtual void stop();

    [[nodiscard]] bool isRunning() const { return running_.load(); }

    [[nodiscard]] const std::string& name() const { return serviceName_; }

protected:
    std::string serviceName_;
    std::atomic<bool> running_{false};
    std::thread worker_;

    virtual void runLoop() = 0;
};

}
