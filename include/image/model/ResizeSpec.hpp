#pragma once

#include <string>
#include <variant>

namespace rf::image::model {

struct Width { unsigned int width; };
struct Height { unsigned int height; };
struct WidthAndHeight { unsigned int width; unsigned int height; };
struct Scale { double factor; };

struct ResizeSpec {
    std::variant<Width, Height, WidthAndHeight, Scale> to;

    ResizeSpec(Width w) : to(w) {}
    ResizeSpec(Height h) : to(h) {}
    ResizeSpec(WidthAndHeight wh) : to(wh) {}
    ResizeSpec(Scale s) : to(s) {}

    // Throws FailedToResize on zero dimensions or a non-positive / non-finite factor.
    void validate() const;

    [[nodiscard]] std::string describe() const;
};

}
