#define STB_IMAGE_IMPLEMENTATION
#define STB_IMAGE_RESIZE_IMPLEMENTATION

#include "image/image.hpp"
#include "image/dimensions.hpp"
#include "image/Error.hpp"
#include "log/Registry.hpp"

#include <stb/stb_image.h>
#include <stb/stb_image_resize.h>

#include <chrono>
#include <cstring>
#include <limits>
#include <memory>
#include <fmt/format.h>

using namespace rf::image::model;
using namespace std::chrono;

namespace rf::image {

namespace {

struct StbiDeleter {
    void operator()(stbi_uc* p) const noexcept { stbi_image_free(p); }
};

using StbiPixels = std::unique_ptr<stbi_uc, StbiDeleter>;

Raster adopt(StbiPixels pixels, const int width, const int height) {
    Raster raster(static_cast<unsigned int>(width), static_cast<unsigned int>(height));
    std::memcpy(raster.pixels.data(), pixels.get(), raster.pixels.size());
    return raster;
}

stbir_filter toStbFilter(const FilterType filter) {
    switch (filter) {
    case FilterType::Box: return STBIR_FILTER_BOX;
    case FilterType::Bilinear: return STBIR_FILTER_TRIANGLE;
    case FilterType::CubicBSpline: return STBIR_FILTER_CUBICBSPLINE;
    case FilterType::CatmullRom: return STBIR_FILTER_CATMULLROM;
    case FilterType::Mitchell: return STBIR_FILTER_MITCHELL;
    }
    return STBIR_FILTER_DEFAULT;
}

double secondsSince(const steady_clock::time_point begin) {
    return duration<double>(steady_clock::now() - begin).count();
}

}

Raster load(const std::filesystem::path& path) {
    const auto begin = steady_clock::now();

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        log::Registry::pipeline()->debug("[image::load] {} is not a regular file", path.string());
        throw NotFound();
    }

    int width = 0, height = 0, channels = 0;
    StbiPixels data(stbi_load(path.c_str(), &width, &height, &channels, Raster::CHANNELS));
    if (!data) {
        const char* reason = stbi_failure_reason();
        log::Registry::pipeline()->warn("[image::load] Failed to decode {}: {}", path.string(),
                                        reason ? reason : "unknown error");
        throw NotFound();
    }

    auto raster = adopt(std::move(data), width, height);
    log::Registry::pipeline()->debug("[image::load] Loaded {} ({}x{}, {} source channels) in {:.3f}s",
                                     path.string(), width, height, channels, secondsSince(begin));
    return raster;
}

Raster resize(Raster original, const ResizeSpec& to, const FilterType filter) {
    const auto begin = steady_clock::now();
    const auto [width, height] = resolve(original.width, original.height, to);
    log::Registry::pipeline()->debug("[image::resize] {}x{} -> {}x{} ({}, {})", original.width, original.height,
                                     width, height, to.describe(), model::to_string(filter));

    Raster resized(width, height);
    const int ok = stbir_resize_uint8_generic(
        original.pixels.data(), static_cast<int>(original.width), static_cast<int>(original.height),
        static_cast<int>(original.stride()),
        resized.pixels.data(), static_cast<int>(width), static_cast<int>(height),
        static_cast<int>(resized.stride()),
        Raster::CHANNELS, 3 /* alpha channel */, 0,
        STBIR_EDGE_CLAMP, toStbFilter(filter), STBIR_COLORSPACE_SRGB, nullptr);

    if (!ok) throw FailedToResize(fmt::format("resampler rejected {}x{} -> {}x{}",
                                              original.width, original.height, width, height));

    log::Registry::pipeline()->debug("[image::resize] Resized in {:.3f}s", secondsSince(begin));
    return resized;
}

}
