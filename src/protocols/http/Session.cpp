#include "protocols/http/Session.hpp"
#include "protocols/http/Router.hpp"
#include "log/Registry.hpp"

using namespace nb::log;

namespace nb::protocols::http {

Session::Session(tcp::socket socket, std::shared_ptr<const Router> router, const uintmax_t bodyLimit)
    : socket_(std::move(socket)), router_(std::move(router)), bodyLimit_(bodyLimit) {}

void Session::run() {
    do_read();
}

void Session::do_read() {
    auto self = shared_from_this();

    // A fresh parser per request; body_limit is per-message state.
    parser_.emplace();
    parser_->body_limit(bodyLimit_);

    http::async_read(socket_, buffer_, *parser_,
                     [self](beast::error_code ec, std::size_t bytes) {
                         self->on_read(ec, bytes);
                     });
}

void Session::on_read(beast::error_code ec, std::size_t bytes) {
    if (ec == http::error::end_of_stream) return do_close();

    if (ec == http::error::body_limit) {
        Registry::http()->warn("[Session] Request body exceeds {} bytes", bodyLimit_);
        auto res = Router::makeErrorResponse(parser_->get(), "Request body too large", status::payload_too_large);
        res.keep_alive(false);
        return send(std::move(res));
    }

    if (ec) {
        Registry::http()->debug("[Session] Read error: {}", ec.message());
        return do_close();
    }

    Registry::http()->trace("[Session] Read {} bytes: {}", bytes, to_std(parser_->get().target()));

    send(router_->route(parser_->release()));
}

void Session::send(string_response&& res) {
    auto self = shared_from_this();
    auto msg = std::make_shared<string_response>(std::move(res));
    const bool close = msg->need_eof();

    http::async_write(socket_, *msg,
                      [self, msg, close](beast::error_code ec, std::size_t bytes) {
                          self->on_write(close, ec, bytes);
                      });
}

void Session::on_write(const bool close, beast::error_code ec, const std::size_t bytes) {
    (void)bytes; // unused

    if (ec) {
        Registry::http()->debug("[Session] Write error: {}", ec.message());
        return do_close();
    }

    if (close) {
        do_close();
        return;
    }

    do_read();
}

void Session::do_close() {
    beast::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_send, ec);
    // ignore errors on shutdown
}

}
