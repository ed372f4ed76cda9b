#include "image/image.hpp"
#include "image/Error.hpp"
#include "log/Registry.hpp"

#include <turbojpeg.h>

#include <algorithm>
#include <chrono>
#include <cmath>

using namespace rf::image::model;
using namespace std::chrono;

namespace rf::image {

std::vector<uint8_t> compress_to_jpeg(const Raster& image, const float quality) {
    const auto begin = steady_clock::now();

    tjhandle tj = tjInitCompress();
    if (!tj) throw FailedToResize("Failed to initialize TurboJPEG compressor");

    unsigned char* jpeg_buf = nullptr;
    unsigned long jpeg_size = 0;

    const int jpegQuality = std::clamp(static_cast<int>(std::lround(quality)), 1, 100);
    constexpr int flags = 0;

    if (tjCompress2(
            tj,
            image.pixels.data(),
            static_cast<int>(image.width),
            0, // pitch (0 = width * pixel size)
            static_cast<int>(image.height),
            TJPF_RGBA, // alpha is dropped
            &jpeg_buf,
            &jpeg_size,
            TJSAMP_444,
            jpegQuality,
            flags) != 0) {
        std::string err = tjGetErrorStr2(tj);
        if (jpeg_buf) tjFree(jpeg_buf);
        tjDestroy(tj);
        throw FailedToResize("JPEG compression failed: " + err);
    }

    std::vector<uint8_t> out(jpeg_buf, jpeg_buf + jpeg_size);
    tjFree(jpeg_buf);
    tjDestroy(tj);

    log::Registry::pipeline()->debug("[image::compress_to_jpeg] Encoded {:.1f} KiB at q{} in {:.3f}s",
                                     static_cast<double>(out.size()) / 1024.0, jpegQuality,
                                     duration<double>(steady_clock::now() - begin).count());
    return out;
}

}
