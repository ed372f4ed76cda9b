#pragma once

#include "protocols/http/Router.hpp"
#include "protocols/http/model/Request.hpp"

#include <exception>
#include <filesystem>

namespace rf::image { class Dispatcher; }

namespace rf::protocols::http::handler {

struct Image {
    // Resolves the image under imagesDir and hands the job to the dispatcher. respond runs
    // once, on the pipeline worker for dispatched jobs or inline for rejected names.
    static void handle(request&& req,
                       model::Request&& pr,
                       const image::Dispatcher& dispatcher,
                       const std::filesystem::path& imagesDir,
                       Responder respond);

    static model::Response toErrorResponse(const request& req,
                                           const std::exception_ptr& error,
                                           const std::string& name);
};

}
