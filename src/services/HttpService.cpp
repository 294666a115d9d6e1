#include "services/HttpService.hpp"
#include "protocols/http/Server.hpp"
#include "protocols/http/Router.hpp"
#include "protocols/TcpAcceptor.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <system_error>
#include <thread>
#include <vector>

using namespace nb::services;
using namespace nb::log;

HttpService::HttpService(const nb::config::HttpServerConfig& cnf,
                         std::shared_ptr<const protocols::http::Router> router)
    : AsyncService("HttpService"),
      threads_(std::max(1u, cnf.threads)),
      ioContext_(std::make_shared<boost::asio::io_context>(static_cast<int>(threads_))),
      httpServer_(std::make_shared<protocols::http::Server>(
          *ioContext_, protocols::makeEndpoint(cnf.host, cnf.port), std::move(router), cnf.max_body_size_bytes)) {}

HttpService::~HttpService() {
    stop();
}

boost::asio::ip::tcp::endpoint HttpService::localEndpoint() const {
    return httpServer_->localEndpoint();
}

void HttpService::stop() {
    if (isRunning()) {
        httpServer_->stop();
        ioContext_->stop();
    }
    AsyncService::stop();
}

boost::asio::io_context::executor_type HttpService::executor() const {
    return ioContext_->get_executor();
}

void HttpService::runContext() const {
    // A throwing completion handler is logged and the thread rejoins the pool
    for (;;) {
        try {
            ioContext_->run();
            return;
        } catch (const std::exception& e) {
            Registry::http()->error("[{}] Handler threw: {}", serviceName_, e.what());
        }
    }
}

void HttpService::runLoop() {
    httpServer_->run();

    Registry::notes()->info("[{}] Serving on {} with {} thread(s)",
                            serviceName_, protocols::endpointToString(localEndpoint()), threads_);

    std::vector<std::thread> pool;
    pool.reserve(threads_ - 1);

    const auto joinPool = [&pool] {
        for (auto& t : pool)
            if (t.joinable()) t.join();
    };

    try {
        for (unsigned int i = 1; i < threads_; ++i) pool.emplace_back([this] { runContext(); });
    } catch (const std::system_error&) {
        ioContext_->stop();
        joinPool();
        throw;
    }

    runContext();
    joinPool();
}
