#include "image/model/Encoding.hpp"

#include <algorithm>
#include <cctype>

namespace rf::image::model {

std::optional<Encoding> parseEncoding(const std::string_view s) {
    std::string lower(s);
    std::ranges::transform(lower, lower.begin(), [](const unsigned char c) { return std::tolower(c); });

    if (lower == "avif") return Encoding::Avif;
    if (lower == "jpeg" || lower == "jpg") return Encoding::Jpeg;
    return std::nullopt;
}

std::string_view mime(const Encoding e) noexcept {
    switch (e) {
    case Encoding::Avif: return "image/avif";
    case Encoding::Jpeg: return "image/jpeg";
    }
    return "application/octet-stream";
}

std::string_view extension(const Encoding e) noexcept {
    switch (e) {
    case Encoding::Avif: return "avif";
    case Encoding::Jpeg: return "jpg";
    }
    return "bin";
}

std::string_view to_string(const Encoding e) noexcept {
    switch (e) {
    case Encoding::Avif: return "avif";
    case Encoding::Jpeg: return "jpeg";
    }
    return "unknown";
}

}
