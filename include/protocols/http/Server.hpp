#pragma once

#include "protocols/TcpServerBase.hpp"

#include <cstdint>
#include <memory>

namespace nb::protocols::http {

class Router;

class Server final : public TcpServerBase {
public:
    Server(asio::io_context& ioc, const tcp::endpoint& endpoint,
           std::shared_ptr<const Router> router, uintmax_t bodyLimit);

protected:
    std::string_view serverName() const noexcept override { return "HttpServer"; }
    void onAccept(tcp::socket socket) override;

private:
    std::shared_ptr<const Router> router_;
    uintmax_t bodyLimit_;
};

}
