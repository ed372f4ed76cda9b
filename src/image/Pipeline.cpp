#include "image/Pipeline.hpp"
#include "image/image.hpp"
#include "log/Registry.hpp"

#include <chrono>

using namespace rf::image;
using namespace rf::image::model;
using namespace std::chrono;

Pipeline::Pipeline(EncodeConfig config) : config_(config) {
    config_.validate();
}

Encoded Pipeline::process(const std::filesystem::path& source, const ResizeSpec& to, const Encoding encoding) const {
    const auto begin = steady_clock::now();

    // Reject a bad spec before touching the filesystem.
    to.validate();

    auto original = load(source);
    auto resized = resize(std::move(original), to, config_.filter);

    Encoded out;
    out.encoding = encoding;
    out.name = source.stem().string() + "." + std::string(extension(encoding));
    out.bytes = encoding == Encoding::Avif
                    ? compress_to_avif(std::move(resized), config_.quality, config_.speed)
                    : compress_to_jpeg(resized, config_.quality);

    log::Registry::pipeline()->debug("[Pipeline] {} ({}, {}) done in {:.3f}s", source.string(), to.describe(),
                                     to_string(encoding), duration<double>(steady_clock::now() - begin).count());
    return out;
}
