#include "protocols/http/handler/Image.hpp"
#include "image/Dispatcher.hpp"
#include "image/Error.hpp"
#include "log/Registry.hpp"
#include "util/files.hpp"

#include <memory>

namespace rf::protocols::http::handler {

void Image::handle(request&& req,
                   model::Request&& pr,
                   const image::Dispatcher& dispatcher,
                   const std::filesystem::path& imagesDir,
                   Responder respond) {
    const auto source = util::resolveUnder(imagesDir, pr.image);
    if (!source) {
        log::Registry::http()->warn("[ImageHandler] Rejected image name '{}'", pr.image);
        return respond(Router::makeErrorResponse(req, "Invalid image name", status::bad_request));
    }

    log::Registry::http()->debug("[ImageHandler] {} -> {} as {}", pr.image, pr.to.describe(),
                                 image::model::to_string(pr.encoding));

    auto shared = std::make_shared<request>(std::move(req));
    image::Job job{*source, pr.to, pr.encoding};

    dispatcher.dispatch(std::move(job), [shared, name = pr.image, respond = std::move(respond)](image::Outcome outcome) {
        if (auto* encoded = std::get_if<image::model::Encoded>(&outcome)) {
            log::Registry::http()->debug("[ImageHandler] {} encoded to {} bytes", name, encoded->bytes.size());
            return respond(Router::makeResponse(*shared, std::move(*encoded)));
        }
        respond(toErrorResponse(*shared, std::get<std::exception_ptr>(outcome), name));
    });
}

model::Response Image::toErrorResponse(const request& req,
                                        const std::exception_ptr& error,
                                        const std::string& name) {
    try {
        std::rethrow_exception(error);
    } catch (const image::NotFound& e) {
        log::Registry::http()->warn("[ImageHandler] {}: {}", name, e.what());
        return Router::makeErrorResponse(req, "not found", status::not_found);
    } catch (const image::FailedToResize& e) {
        log::Registry::http()->error("[ImageHandler] {}: {}", name, e.what());
        return Router::makeErrorResponse(req, e.detail(), status::internal_server_error);
    } catch (const std::exception& e) {
        log::Registry::http()->error("[ImageHandler] Unexpected error for {}: {}", name, e.what());
        return Router::makeErrorResponse(req, "Internal server error", status::internal_server_error);
    }
}

}
