#pragma once

#include "image/model/Raster.hpp"
#include "image/model/Encoding.hpp"

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace rf::test {

// Diagonal colour gradient with an opaque alpha channel.
image::model::Raster gradient(unsigned int width, unsigned int height);

void writeJpeg(const std::filesystem::path& path, unsigned int width, unsigned int height);
void writePng(const std::filesystem::path& path, unsigned int width, unsigned int height);

std::vector<uint8_t> readFile(const std::filesystem::path& path);

// Width and height of an encoded AVIF or JPEG buffer.
std::pair<unsigned int, unsigned int> decodedSize(const image::model::Encoded& encoded);

// Fresh directory under the system temp dir, removed with the object.
class TempDir {
public:
    explicit TempDir(const std::string& prefix);
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] std::filesystem::path operator/(const std::string& name) const { return path_ / name; }

private:
    std::filesystem::path path_;
};

}
