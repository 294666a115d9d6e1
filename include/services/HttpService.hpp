#pragma once

#include "services/AsyncService.hpp"
#include "config/Config.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <memory>

namespace nb::protocols::http { class Server; class Router; }

namespace nb::services {

/**
 * Runs the HTTP server on its own io_context.
 *
 * The listening socket is bound in the constructor, so a bad host/port fails
 * at construction instead of inside the worker thread. runLoop() drives the
 * io_context from `threads` threads until stop().
 */
class HttpService final : public AsyncService {
public:
    HttpService(const config::HttpServerConfig& cnf, std::shared_ptr<const protocols::http::Router> router);
    ~HttpService() override;

    void stop() override;

    [[nodiscard]] boost::asio::ip::tcp::endpoint localEndpoint() const;

    // For posting work onto the server threads.
    [[nodiscard]] boost::asio::io_context::executor_type executor() const;

protected:
    void runLoop() override;

private:
    void runContext() const;

    unsigned int threads_;
    std::shared_ptr<boost::asio::io_context> ioContext_;
    std::shared_ptr<protocols::http::Server> httpServer_;
};

}
