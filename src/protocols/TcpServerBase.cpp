#include "protocols/TcpServerBase.hpp"
#include "log/Registry.hpp"

#include <utility>

namespace nb::protocols {

TcpServerBase::TcpServerBase(asio::io_context& ioc, const tcp::endpoint& endpoint, const LogChannel channel)
    : ioc_(ioc), acceptor_(ioc), channel_(channel) {
    init_acceptor(acceptor_, endpoint);
}

void TcpServerBase::run() {
    logger()->info("[{}] Listening on {}", serverName(), endpointToString(acceptor_.local_endpoint()));
    doAccept();
}

void TcpServerBase::stop() {
    asio::post(acceptor_.get_executor(), [self = shared_from_this()] {
        beast::error_code ec;
        self->acceptor_.close(ec);
        if (ec) self->logger()->debug("[{}] Acceptor close failed: {}", self->serverName(), ec.message());
    });
}

std::shared_ptr<spdlog::logger> TcpServerBase::logger() const {
    return channel_ == LogChannel::Http ? log::Registry::http() : log::Registry::notes();
}

void TcpServerBase::doAccept() {
    acceptor_.async_accept(asio::make_strand(ioc_),
        [self = shared_from_this()](const beast::error_code& ec, tcp::socket socket) {
            if (ec == asio::error::operation_aborted || !self->acceptor_.is_open()) return;

            self->doAccept();

            if (ec) {
                self->logger()->debug("[{}] Accept failed: {}", self->serverName(), ec.message());
                return;
            }

            self->onAccept(std::move(socket));
        });
}

}
