#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace rf::image::model {

// Resampling kernels offered by stb_image_resize.
enum class FilterType { Box, Bilinear, CubicBSpline, CatmullRom, Mitchell };

std::optional<FilterType> parseFilter(std::string_view s);
std::string_view to_string(FilterType f) noexcept;

struct EncodeConfig {
    static constexpr float MIN_QUALITY = 1.0f, MAX_QUALITY = 100.0f;
    static constexpr int MIN_SPEED = 1, MAX_SPEED = 10;

    float quality = 90.0f;   // AVIF uses it as-is, JPEG rounds it
    int speed = 4;           // AVIF only, lower is slower and smaller
    FilterType filter = FilterType::CatmullRom;

    // Throws std::invalid_argument when quality or speed is out of range.
    void validate() const;
};

}
