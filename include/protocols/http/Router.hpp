#pragma once

#include "protocols/http/model/Response.hpp"
#include "image/model/Encoding.hpp"

#include <boost/beast/http.hpp>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

namespace rf::image { class Dispatcher; }

namespace rf::protocols::http {

using request = boost::beast::http::request<boost::beast::http::string_body>;

template<class Body>
using response = boost::beast::http::response<Body>;

using string_body = boost::beast::http::string_body;
using vector_body = boost::beast::http::vector_body<uint8_t>;

using field = boost::beast::http::field;
using verb = boost::beast::http::verb;
using status = boost::beast::http::status;

using string_response = response<string_body>;
using vector_response = response<vector_body>;

// Invoked exactly once per routed request, possibly from a pipeline worker thread.
using Responder = std::function<void(model::Response)>;

class Router {
public:
    Router(std::shared_ptr<const image::Dispatcher> dispatcher, std::filesystem::path imagesDir);

    void route(request&& req, Responder respond) const;

    [[nodiscard]] const std::filesystem::path& imagesDir() const noexcept { return imagesDir_; }

    static model::Response makeResponse(const request& req, image::model::Encoded&& encoded);

    static model::Response makeErrorResponse(const request& req,
                                             const std::string& msg,
                                             const status& status = status::not_found);

private:
    std::shared_ptr<const image::Dispatcher> dispatcher_;
    std::filesystem::path imagesDir_;
};

}
