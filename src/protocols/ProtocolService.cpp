#include "protocols/ProtocolService.hpp"
#include "protocols/http/Server.hpp"
#include "protocols/http/Router.hpp"
#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"

#include <boost/asio/io_context.hpp>
#include <chrono>
#include <filesystem>
#include <stdexcept>

using namespace rf::protocols;
using namespace rf::config;

ProtocolService::ProtocolService(std::shared_ptr<const image::Dispatcher> dispatcher)
    : AsyncService("Reframe"), dispatcher_(std::move(dispatcher)) {}

ProtocolService::~ProtocolService() {
    stop();
    shutdownIo();
}

void ProtocolService::start() {
    if (isRunning()) return;
    initHttpServer();
    AsyncService::start();
}

boost::asio::ip::tcp::endpoint ProtocolService::endpoint() const {
    if (!httpServer_) throw std::runtime_error("HTTP server not started");
    return httpServer_->localEndpoint();
}

void ProtocolService::initHttpServer() {
    const auto& cfg = ConfigRegistry::get().server;

    if (!std::filesystem::is_directory(cfg.images_dir))
        throw std::runtime_error("Images directory does not exist: " + cfg.images_dir.string());

    ioContext_ = std::make_shared<boost::asio::io_context>(static_cast<int>(cfg.io_threads));

    const auto endpoint = asio::ip::tcp::endpoint(asio::ip::make_address(cfg.host), cfg.port);
    const auto router = std::make_shared<const http::Router>(dispatcher_, cfg.images_dir);
    httpServer_ = std::make_shared<http::Server>(*ioContext_, endpoint, router);

    log::Registry::reframe()->info("[Reframe] Serving images from {} (concurrency limit {})",
                                   std::filesystem::absolute(cfg.images_dir).string(), cfg.concurrency_limit);
}

void ProtocolService::runLoop() {
    httpServer_->run();

    const auto n = ConfigRegistry::get().server.io_threads;
    for (unsigned int i = 0; i < n; ++i)
        ioThreads_.emplace_back([ctx = ioContext_] { ctx->run(); });

    log::Registry::reframe()->debug("[Reframe] {} I/O threads running", n);

    while (!shouldStop()) std::this_thread::sleep_for(std::chrono::milliseconds(100));

    shutdownIo();
}

void ProtocolService::shutdownIo() {
    if (httpServer_) httpServer_->stop();
    if (ioContext_) ioContext_->stop();
    for (auto& t : ioThreads_) if (t.joinable()) t.join();
    ioThreads_.clear();
}
