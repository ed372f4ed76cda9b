#include "image/model/ResizeSpec.hpp"
#include "image/Error.hpp"

#include <cmath>
#include <fmt/format.h>

using namespace rf::image;
using namespace rf::image::model;

namespace {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

void requirePositive(const unsigned int v, const char* name) {
    if (v == 0) throw FailedToResize(fmt::format("{} must be a positive integer", name));
}

}

void ResizeSpec::validate() const {
    std::visit(overloaded{
        [](const Width& w) { requirePositive(w.width, "width"); },
        [](const Height& h) { requirePositive(h.height, "height"); },
        [](const WidthAndHeight& wh) {
            requirePositive(wh.width, "width");
            requirePositive(wh.height, "height");
        },
        [](const Scale& s) {
            if (!std::isfinite(s.factor) || s.factor <= 0.0)
                throw FailedToResize(fmt::format("scale must be a positive number, got {}", s.factor));
        }
    }, to);
}

std::string ResizeSpec::describe() const {
    return std::visit(overloaded{
        [](const Width& w) { return fmt::format("width={}", w.width); },
        [](const Height& h) { return fmt::format("height={}", h.height); },
        [](const WidthAndHeight& wh) { return fmt::format("width={} height={}", wh.width, wh.height); },
        [](const Scale& s) { return fmt::format("scale={}", s.factor); }
    }, to);
}
