#include "image/dimensions.hpp"
#include "image/Error.hpp"

#include <cmath>
#include <fmt/format.h>

using namespace rf::image::model;

namespace rf::image {

double aspectRatio(const unsigned int width, const unsigned int height) {
    return static_cast<double>(width) / static_cast<double>(height);
}

unsigned int roundDimension(const double value, const char* name) {
    const double rounded = std::round(value);
    if (!std::isfinite(rounded) || rounded < 1.0)
        throw FailedToResize(fmt::format("resolved {} rounds to zero ({})", name, value));
    if (rounded > static_cast<double>(MAX_DIMENSION))
        throw FailedToResize(fmt::format("resolved {} {} exceeds the maximum of {}", name, rounded, MAX_DIMENSION));
    return static_cast<unsigned int>(rounded);
}

Dimensions resolve(const unsigned int width, const unsigned int height, const ResizeSpec& spec) {
    if (width == 0 || height == 0)
        throw FailedToResize(fmt::format("source has zero dimension {}x{}", width, height));

    spec.validate();

    if (const auto* w = std::get_if<Width>(&spec.to)) {
        const auto ar = aspectRatio(width, height);
        return {roundDimension(w->width, "width"), roundDimension(w->width / ar, "height")};
    }

    if (const auto* h = std::get_if<Height>(&spec.to)) {
        const auto ar = aspectRatio(width, height);
        return {roundDimension(h->height * ar, "width"), roundDimension(h->height, "height")};
    }

    if (const auto* wh = std::get_if<WidthAndHeight>(&spec.to))
        return {roundDimension(wh->width, "width"), roundDimension(wh->height, "height")};

    const auto& s = std::get<Scale>(spec.to);
    return {roundDimension(width * s.factor, "width"), roundDimension(height * s.factor, "height")};
}

}
