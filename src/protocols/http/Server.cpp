#include "protocols/http/Server.hpp"
#include "protocols/http/Session.hpp"
#include "protocols/http/Router.hpp"

#include <stdexcept>

using namespace rf::protocols::http;

Server::Server(net::io_context& ioc, const tcp::endpoint& endpoint, std::shared_ptr<const Router> router)
    : TcpServerBase(ioc, endpoint, protocols::TcpServerOptions{
          .acceptConcurrency = 1,
          .useStrand = true,
          .channel = protocols::LogChannel::Http
      }),
      router_(std::move(router)) {
    if (!router_) throw std::invalid_argument("Server requires a router");
}

void Server::onAccept(tcp::socket socket) {
    std::make_shared<Session>(std::move(socket), router_)->run();
}
