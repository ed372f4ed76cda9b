#pragma once

#include <utility>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/system/system_error.hpp>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace rf::protocols {

namespace asio  = boost::asio;
namespace beast = boost::beast;
using tcp = asio::ip::tcp;

[[noreturn]] inline void throw_with_context(std::string_view what, std::string_view detail) {
    throw std::runtime_error(std::string(what) + ": " + std::string(detail));
}

template <class Fn>
void wrap_sys(const std::string_view what, Fn&& fn) {
    try { std::forward<Fn>(fn)(); }
    catch (const boost::system::system_error& e) { throw_with_context(what, e.what()); }
}

inline std::string endpointToString(const tcp::endpoint& ep) {
    return ep.address().to_string() + ":" + std::to_string(ep.port());
}

inline void init_acceptor(tcp::acceptor& acceptor, const tcp::endpoint& endpoint) {
    wrap_sys("Failed to open acceptor", [&] { acceptor.open(endpoint.protocol()); });
    wrap_sys("Failed to set reuse_address", [&] {
        acceptor.set_option(asio::socket_base::reuse_address(true));
    });
    wrap_sys("Failed to bind acceptor to " + endpointToString(endpoint), [&] { acceptor.bind(endpoint); });
    wrap_sys("Failed to listen on acceptor", [&] {
        acceptor.listen(asio::socket_base::max_listen_connections);
    });
}

// "host:port", "host" or ":port". Throws std::invalid_argument on a malformed port or address.
inline tcp::endpoint parseEndpoint(const std::string& addr, const uint16_t defaultPort) {
    std::string host = addr;
    uint16_t port = defaultPort;

    if (const auto colon = addr.rfind(':'); colon != std::string::npos) {
        host = addr.substr(0, colon);
        const auto portStr = addr.substr(colon + 1);
        if (portStr.empty() || portStr.size() > 5 || portStr.find_first_not_of("0123456789") != std::string::npos)
            throw std::invalid_argument("Invalid port in address: " + addr);
        const auto v = std::stoul(portStr);
        if (v > 65535) throw std::invalid_argument("Invalid port in address: " + addr);
        port = static_cast<uint16_t>(v);
    }

    if (host.empty()) host = "0.0.0.0";

    boost::system::error_code ec;
    const auto address = asio::ip::make_address(host, ec);
    if (ec) throw std::invalid_argument("Invalid host in address: " + addr);
    return {address, port};
}

}
