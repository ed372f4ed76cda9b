#pragma once

#include "image/model/Raster.hpp"
#include "image/model/ResizeSpec.hpp"
#include "image/model/EncodeConfig.hpp"

#include <cstdint>
#include <filesystem>
#include <vector>

namespace rf::image {

// Decode any stb_image-supported file to RGBA. Throws NotFound.
model::Raster load(const std::filesystem::path& path);

// Resample to the dimensions resolved from `to`. Throws FailedToResize.
model::Raster resize(model::Raster original, const model::ResizeSpec& to, model::FilterType filter);

// Throws FailedToResize on any encoder error.
std::vector<uint8_t> compress_to_avif(model::Raster image, float quality, int speed);
std::vector<uint8_t> compress_to_jpeg(const model::Raster& image, float quality);

// Maps quality 1..100 onto the AV1 quantizer range 63..0.
int avifQuantizer(float quality);

}
