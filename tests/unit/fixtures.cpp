#include "fixtures.hpp"
#include "image/image.hpp"
#include "util/files.hpp"

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb/stb_image_write.h>
#include <stb/stb_image.h>

#include <avif/avif.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <fstream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <unistd.h>

namespace fs = std::filesystem;

namespace rf::test {

image::model::Raster gradient(const unsigned int width, const unsigned int height) {
    image::model::Raster r(width, height);
    for (unsigned int y = 0; y < height; ++y) {
        for (unsigned int x = 0; x < width; ++x) {
            auto* px = &r.pixels[y * r.stride() + x * image::model::Raster::CHANNELS];
            px[0] = static_cast<uint8_t>(x * 255 / std::max(1u, width - 1));
            px[1] = static_cast<uint8_t>(y * 255 / std::max(1u, height - 1));
            px[2] = static_cast<uint8_t>((x + y) % 256);
            px[3] = 255;
        }
    }
    return r;
}

void writeJpeg(const fs::path& path, const unsigned int width, const unsigned int height) {
    util::writeFile(path, image::compress_to_jpeg(gradient(width, height), 90.0f));
}

void writePng(const fs::path& path, const unsigned int width, const unsigned int height) {
    const auto r = gradient(width, height);
    if (!stbi_write_png(path.c_str(), static_cast<int>(width), static_cast<int>(height),
                        image::model::Raster::CHANNELS, r.pixels.data(), static_cast<int>(r.stride())))
        throw std::runtime_error("stbi_write_png failed for " + path.string());
}

std::vector<uint8_t> readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error("Failed to open " + path.string());
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

std::pair<unsigned int, unsigned int> decodedSize(const image::model::Encoded& encoded) {
    if (encoded.encoding == image::model::Encoding::Jpeg) {
        int w = 0, h = 0, channels = 0;
        if (!stbi_info_from_memory(encoded.bytes.data(), static_cast<int>(encoded.bytes.size()), &w, &h, &channels))
            throw std::runtime_error(std::string("stbi_info_from_memory: ") + stbi_failure_reason());
        return {static_cast<unsigned int>(w), static_cast<unsigned int>(h)};
    }

    const std::unique_ptr<avifDecoder, decltype(&avifDecoderDestroy)> decoder(avifDecoderCreate(), avifDecoderDestroy);
    if (!decoder) throw std::runtime_error("avifDecoderCreate failed");

    if (const auto res = avifDecoderSetIOMemory(decoder.get(), encoded.bytes.data(), encoded.bytes.size());
        res != AVIF_RESULT_OK)
        throw std::runtime_error(std::string("avifDecoderSetIOMemory: ") + avifResultToString(res));

    if (const auto res = avifDecoderParse(decoder.get()); res != AVIF_RESULT_OK)
        throw std::runtime_error(std::string("avifDecoderParse: ") + avifResultToString(res));

    return {decoder->image->width, decoder->image->height};
}

TempDir::TempDir(const std::string& prefix) {
    static std::atomic<unsigned int> counter{0};
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    path_ = fs::temp_directory_path() /
            (prefix + "_" + std::to_string(::getpid()) + "_" + std::to_string(stamp) + "_" + std::to_string(counter++));
    fs::create_directories(path_);
}

TempDir::~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
}

}
