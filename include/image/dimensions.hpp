#pragma once

#include "image/model/ResizeSpec.hpp"

namespace rf::image {

// JPEG and AVIF both top out at 16-bit dimensions.
constexpr unsigned int MAX_DIMENSION = 65535;

struct Dimensions {
    unsigned int width;
    unsigned int height;

    bool operator==(const Dimensions&) const = default;
};

double aspectRatio(unsigned int width, unsigned int height);

// Round half away from zero and reject results outside [1, MAX_DIMENSION].
unsigned int roundDimension(double value, const char* name);

// Target size for a source of width x height. WidthAndHeight stretches, the others
// keep the source aspect ratio. Throws FailedToResize before anything is allocated.
Dimensions resolve(unsigned int width, unsigned int height, const model::ResizeSpec& spec);

}
