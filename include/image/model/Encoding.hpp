#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rf::image::model {

enum class Encoding { Avif, Jpeg };

// Accepts "avif", "jpeg" or "jpg" (any case).
std::optional<Encoding> parseEncoding(std::string_view s);

std::string_view mime(Encoding e) noexcept;
std::string_view extension(Encoding e) noexcept;
std::string_view to_string(Encoding e) noexcept;

struct Encoded {
    std::vector<uint8_t> bytes;
    Encoding encoding{Encoding::Avif};
    std::optional<std::string> name;

    [[nodiscard]] std::string_view mime() const noexcept { return model::mime(encoding); }
};

}
