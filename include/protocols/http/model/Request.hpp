#pragma once

#include "image/model/Encoding.hpp"
#include "image/model/ResizeSpec.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace rf::protocols::http::model {

// A parsed /images/resized/... target.
struct Request {
    image::model::ResizeSpec to;
    std::string image;
    image::model::Encoding encoding{image::model::Encoding::Avif};

    // nullopt when the target matches no route. Throws std::invalid_argument when it does
    // match but a segment is malformed (number, encoding or percent escape).
    static std::optional<Request> parse(std::string_view target);
};

}
