#pragma once

#include "protocols/TcpAcceptor.hpp"

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <memory>
#include <string_view>

namespace spdlog { class logger; }

namespace nb::protocols {

namespace asio  = boost::asio;
namespace beast = boost::beast;
using tcp = asio::ip::tcp;

enum class LogChannel { Http, General };

/**
 * Listening socket plus a single outstanding accept.
 *
 * The acceptor is bound in the constructor. Every accepted connection gets
 * its own strand and is handed to onAccept().
 */
class TcpServerBase : public std::enable_shared_from_this<TcpServerBase> {
public:
    TcpServerBase(asio::io_context& ioc, const tcp::endpoint& endpoint, LogChannel channel);
    virtual ~TcpServerBase() = default;

    void run();

    // Closes the acceptor; the pending accept completes with operation_aborted.
    void stop();

    [[nodiscard]] tcp::endpoint localEndpoint() const { return acceptor_.local_endpoint(); }

protected:
    virtual std::string_view serverName() const noexcept = 0;
    virtual void onAccept(tcp::socket socket) = 0;

    std::shared_ptr<spdlog::logger> logger() const;

private:
    void doAccept();

    asio::io_context& ioc_;
    tcp::acceptor acceptor_;
    LogChannel channel_;
};

}
