#include "protocols/http/Router.hpp"
#include "protocols/http/handler/Image.hpp"
#include "protocols/http/model/Request.hpp"
#include "image/Dispatcher.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>
#include <stdexcept>

using namespace rf::protocols::http;
using namespace rf;

Router::Router(std::shared_ptr<const image::Dispatcher> dispatcher, std::filesystem::path imagesDir)
    : dispatcher_(std::move(dispatcher)), imagesDir_(std::move(imagesDir)) {
    if (!dispatcher_) throw std::invalid_argument("Router requires a dispatcher");
}

void Router::route(request&& req, Responder respond) const {
    if (req.method() != verb::get) {
        log::Registry::http()->debug("[Router] Rejecting {} {}", std::string(req.method_string()), std::string(req.target()));
        return respond(makeErrorResponse(req, "Invalid request", status::bad_request));
    }

    std::optional<model::Request> parsed;
    try {
        parsed = model::Request::parse(std::string_view(req.target().data(), req.target().size()));
    } catch (const std::invalid_argument& e) {
        log::Registry::http()->warn("[Router] Bad request {}: {}", std::string(req.target()), e.what());
        return respond(makeErrorResponse(req, e.what(), status::bad_request));
    }

    if (!parsed) {
        log::Registry::http()->debug("[Router] No route for {}", std::string(req.target()));
        return respond(makeErrorResponse(req, "Not found", status::not_found));
    }

    handler::Image::handle(std::move(req), std::move(*parsed), *dispatcher_, imagesDir_, std::move(respond));
}

model::Response Router::makeResponse(const request& req, image::model::Encoded&& encoded) {
    const auto size = encoded.bytes.size();
    const auto mime = std::string(encoded.mime());
    const auto name = encoded.name.value_or(fmt::format("image.{}", extension(encoded.encoding)));

    vector_response res{
        std::piecewise_construct,
        std::make_tuple(std::move(encoded.bytes)),
        std::make_tuple(status::ok, req.version())
    };

    res.set(field::content_type, mime);
    res.set(field::content_disposition, fmt::format("inline; filename=\"{}\"", name));
    res.content_length(size);
    res.keep_alive(req.keep_alive());

    return res;
}

model::Response Router::makeErrorResponse(const request& req,
                                          const std::string& msg,
                                          const status& status) {
    string_response res{status, req.version()};
    res.set(field::content_type, "text/plain");
    res.body() = msg;
    res.prepare_payload();
    res.keep_alive(req.keep_alive());
    return res;
}
