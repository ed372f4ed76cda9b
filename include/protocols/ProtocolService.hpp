#pragma once

#include "concurrency/AsyncService.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <memory>
#include <thread>
#include <vector>

namespace boost::asio { class io_context; }
namespace rf::image { class Dispatcher; }

namespace rf::protocols {

namespace http { class Server; }

// Owns the io_context, its I/O threads and the HTTP server.
class ProtocolService final : public concurrency::AsyncService {
public:
    explicit ProtocolService(std::shared_ptr<const image::Dispatcher> dispatcher);
    ~ProtocolService() override;

    // Binds before the run loop starts so that a bad address or a missing images
    // directory surfaces here as an exception.
    void start() override;

    [[nodiscard]] boost::asio::ip::tcp::endpoint endpoint() const;

protected:
    void runLoop() override;

private:
    std::shared_ptr<const image::Dispatcher> dispatcher_;
    std::shared_ptr<boost::asio::io_context> ioContext_;
    std::shared_ptr<http::Server> httpServer_;
    std::vector<std::thread> ioThreads_;

    void initHttpServer();
    void shutdownIo();
};

}
