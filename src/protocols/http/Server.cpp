#include "protocols/http/Server.hpp"
#include "protocols/http/Session.hpp"
#include "protocols/http/Router.hpp"

#include <stdexcept>

using namespace nb::protocols::http;

Server::Server(asio::io_context& ioc, const tcp::endpoint& endpoint,
               std::shared_ptr<const Router> router, const uintmax_t bodyLimit)
    : TcpServerBase(ioc, endpoint, protocols::LogChannel::Http),
      router_(std::move(router)), bodyLimit_(bodyLimit) {
    if (!router_) throw std::invalid_argument("Router cannot be null");
}

void Server::onAccept(tcp::socket socket) {
    std::make_shared<Session>(std::move(socket), router_, bodyLimit_)->run();
}
