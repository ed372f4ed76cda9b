#include "image/image.hpp"
#include "image/Error.hpp"
#include "log/Registry.hpp"

#include <avif/avif.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <memory>

using namespace rf::image::model;
using namespace std::chrono;

namespace rf::image {

namespace {

struct AvifImageDeleter {
    void operator()(avifImage* p) const noexcept { avifImageDestroy(p); }
};

struct AvifEncoderDeleter {
    void operator()(avifEncoder* p) const noexcept { avifEncoderDestroy(p); }
};

// Frees the encoder output on every path out of compress_to_avif.
struct RWData {
    avifRWData data = AVIF_DATA_EMPTY;
    ~RWData() { avifRWDataFree(&data); }
};

void check(const avifResult result, const char* what) {
    if (result != AVIF_RESULT_OK)
        throw FailedToResize(std::string(what) + ": " + avifResultToString(result));
}

}

int avifQuantizer(const float quality) {
    const double q = std::clamp(static_cast<double>(quality), 1.0, 100.0);
    const auto quantizer = std::lround((100.0 - q) * AVIF_QUANTIZER_WORST_QUALITY / 99.0);
    return std::clamp(static_cast<int>(quantizer), AVIF_QUANTIZER_BEST_QUALITY, AVIF_QUANTIZER_WORST_QUALITY);
}

std::vector<uint8_t> compress_to_avif(Raster image, const float quality, const int speed) {
    const auto begin = steady_clock::now();

    std::unique_ptr<avifImage, AvifImageDeleter> avif(
        avifImageCreate(image.width, image.height, 8, AVIF_PIXEL_FORMAT_YUV444));
    if (!avif) throw FailedToResize("Failed to allocate AVIF image");

    avifRGBImage rgb;
    avifRGBImageSetDefaults(&rgb, avif.get());
    rgb.format = AVIF_RGB_FORMAT_RGBA;
    rgb.depth = 8;
    rgb.pixels = image.pixels.data();
    rgb.rowBytes = static_cast<uint32_t>(image.stride());

    check(avifImageRGBToYUV(avif.get(), &rgb), "AVIF colour conversion failed");

    std::unique_ptr<avifEncoder, AvifEncoderDeleter> encoder(avifEncoderCreate());
    if (!encoder) throw FailedToResize("Failed to create AVIF encoder");

    const int quantizer = avifQuantizer(quality);
    encoder->maxThreads = 1;
    encoder->speed = std::clamp(speed, EncodeConfig::MIN_SPEED, EncodeConfig::MAX_SPEED);
    encoder->minQuantizer = quantizer;
    encoder->maxQuantizer = quantizer;
    encoder->minQuantizerAlpha = quantizer;
    encoder->maxQuantizerAlpha = quantizer;

    RWData output;
    check(avifEncoderWrite(encoder.get(), avif.get(), &output.data), "AVIF encoding failed");

    std::vector<uint8_t> out(output.data.data, output.data.data + output.data.size);

    log::Registry::pipeline()->debug("[image::compress_to_avif] Encoded {:.1f} KiB (q{}, quantizer {}, speed {}) in {:.3f}s",
                                     static_cast<double>(out.size()) / 1024.0, quality, quantizer, encoder->speed,
                                     duration<double>(steady_clock::now() - begin).count());
    return out;
}

}
