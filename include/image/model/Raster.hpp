#pragma once

#include <cstdint>
#include <cstddef>
#include <utility>
#include <vector>

namespace rf::image::model {

// 8-bit RGBA, row-major, no padding between rows.
struct Raster {
    static constexpr unsigned int CHANNELS = 4;

    unsigned int width{0};
    unsigned int height{0};
    std::vector<uint8_t> pixels;

    Raster() = default;
    Raster(const unsigned int w, const unsigned int h)
        : width(w), height(h), pixels(byteSize(w, h)) {}
    Raster(const unsigned int w, const unsigned int h, std::vector<uint8_t>&& data)
        : width(w), height(h), pixels(std::move(data)) {}

    Raster(const Raster&) = delete;
    Raster& operator=(const Raster&) = delete;
    Raster(Raster&&) noexcept = default;
    Raster& operator=(Raster&&) noexcept = default;

    [[nodiscard]] size_t stride() const noexcept { return static_cast<size_t>(width) * CHANNELS; }
    [[nodiscard]] bool empty() const noexcept { return pixels.empty(); }

    static size_t byteSize(const unsigned int w, const unsigned int h) noexcept {
        return static_cast<size_t>(w) * h * CHANNELS;
    }
};

}
