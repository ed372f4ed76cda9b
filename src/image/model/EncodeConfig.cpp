#include "image/model/EncodeConfig.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>
#include <fmt/format.h>

namespace rf::image::model {

std::optional<FilterType> parseFilter(const std::string_view s) {
    std::string lower(s);
    std::ranges::transform(lower, lower.begin(), [](const unsigned char c) { return std::tolower(c); });

    if (lower == "box") return FilterType::Box;
    if (lower == "bilinear" || lower == "triangle") return FilterType::Bilinear;
    if (lower == "cubicbspline" || lower == "cubic") return FilterType::CubicBSpline;
    if (lower == "catmullrom" || lower == "catmull-rom") return FilterType::CatmullRom;
    if (lower == "mitchell") return FilterType::Mitchell;
    return std::nullopt;
}

std::string_view to_string(const FilterType f) noexcept {
    switch (f) {
    case FilterType::Box: return "box";
    case FilterType::Bilinear: return "bilinear";
    case FilterType::CubicBSpline: return "cubicbspline";
    case FilterType::CatmullRom: return "catmullrom";
    case FilterType::Mitchell: return "mitchell";
    }
    return "unknown";
}

void EncodeConfig::validate() const {
    if (!std::isfinite(quality) || quality < MIN_QUALITY || quality > MAX_QUALITY)
        throw std::invalid_argument(fmt::format("quality must be within [{}, {}], got {}",
                                                MIN_QUALITY, MAX_QUALITY, quality));

    if (speed < MIN_SPEED || speed > MAX_SPEED)
        throw std::invalid_argument(fmt::format("speed must be within [{}, {}], got {}",
                                                MIN_SPEED, MAX_SPEED, speed));
}

}
