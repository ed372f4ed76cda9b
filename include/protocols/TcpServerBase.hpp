#pragma once

#include "protocols/TCPAcceptor.hpp"

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <memory>
#include <string_view>

namespace spdlog { class logger; }

namespace rf::protocols {

namespace asio  = boost::asio;
namespace beast = boost::beast;
using tcp = asio::ip::tcp;

enum class LogChannel { Http, General };

struct TcpServerOptions {
    unsigned int acceptConcurrency{1};
    bool useStrand{true};
    LogChannel channel{LogChannel::General};
};

class TcpServerBase : public std::enable_shared_from_this<TcpServerBase> {
public:
    TcpServerBase(asio::io_context& ioc, const tcp::endpoint& endpoint, TcpServerOptions opts);
    virtual ~TcpServerBase() = default;

    void run();

    // Closes the acceptor; pending accepts complete with operation_aborted.
    void stop();

    // The bound endpoint, with the real port when 0 was requested.
    [[nodiscard]] tcp::endpoint localEndpoint() const { return acceptor_.local_endpoint(); }

protected:
    virtual std::string_view serverName() const noexcept = 0;
    virtual void onAccept(tcp::socket socket) = 0;

    // Override if a server wants different accept error behavior
    virtual void onAcceptError(const beast::error_code& ec);

    asio::io_context& ioc() const noexcept { return ioc_; }

    std::shared_ptr<spdlog::logger> logger() const;

private:
    void logStart() const;
    void doAccept();

    asio::io_context& ioc_;
    tcp::acceptor acceptor_;
    TcpServerOptions opts_;
};

}
