#pragma once

#include "protocols/http/types.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/asio.hpp>
#include <cstdint>
#include <memory>
#include <optional>

namespace nb::protocols::http {

namespace beast = boost::beast;
namespace http = beast::http;
using tcp = boost::asio::ip::tcp;

class Router;

class Session : public std::enable_shared_from_this<Session> {
public:
    Session(tcp::socket socket, std::shared_ptr<const Router> router, uintmax_t bodyLimit);

    void run();

private:
    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes);
    void send(string_response&& res);
    void on_write(bool close, beast::error_code ec, std::size_t bytes);
    void do_close();

    tcp::socket socket_;
    beast::flat_buffer buffer_;
    std::optional<http::request_parser<http::string_body>> parser_;

    std::shared_ptr<const Router> router_;
    uintmax_t bodyLimit_;
};

}
