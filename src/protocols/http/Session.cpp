#include "protocols/http/Session.hpp"
#include "protocols/http/Router.hpp"
#include "log/Registry.hpp"

using namespace rf::protocols::http;
using rf::log::Registry;

Session::Session(tcp::socket socket, std::shared_ptr<const Router> router)
    : socket_(std::move(socket)), router_(std::move(router)) { buffer_.max_size(8192); }

void Session::run() {
    // Start on the connection's strand
    boost::asio::dispatch(socket_.get_executor(), [self = shared_from_this()] { self->do_read(); });
}

void Session::do_read() {
    req_ = {};
    http::async_read(socket_, buffer_, req_,
                     [self = shared_from_this()](beast::error_code ec, std::size_t bytes) {
                         self->on_read(ec, bytes);
                     });
}

void Session::on_read(beast::error_code ec, std::size_t bytes) {
    if (ec == http::error::end_of_stream) return do_close();

    if (ec) {
        Registry::http()->debug("[Session] Read error: {}", ec.message());
        return do_close();
    }

    Registry::http()->debug("[Session] Read {} bytes: {} {}", bytes,
                            std::string(req_.method_string()), std::string(req_.target()));

    // The responder may fire from a pipeline worker; hop back onto the connection's strand.
    auto self = shared_from_this();
    router_->route(std::move(req_), [self](model::Response res) {
        boost::asio::post(self->socket_.get_executor(), [self, res = std::move(res)]() mutable {
            self->do_write(std::move(res));
        });
    });
}

void Session::do_write(model::Response&& res) {
    auto self = shared_from_this();

    std::visit([self](auto&& response) {
        using T = std::decay_t<decltype(response)>;
        auto msg = std::make_shared<T>(std::forward<decltype(response)>(response));
        const bool close = msg->need_eof();
        http::async_write(self->socket_, *msg,
                          [self, msg, close](beast::error_code ec, std::size_t bytes) {
                              self->on_write(close, ec, bytes);
                          });
    }, std::move(res));
}

void Session::on_write(const bool close, beast::error_code ec, const std::size_t bytes) {
    if (ec) {
        // Client went away while the pipeline ran
        Registry::http()->debug("[Session] Write error after {} bytes: {}", bytes, ec.message());
        return do_close();
    }

    if (close) return do_close();

    do_read();
}

void Session::do_close() {
    beast::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_send, ec);
    if (ec && ec != beast::errc::not_connected)
        Registry::http()->debug("[Session] Shutdown: {}", ec.message());
}
