#include "util/http.hpp"

#include <cctype>
#include <stdexcept>

namespace rf::util {

namespace {

int hexValue(const char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

}

std::string url_decode(const std::string_view value) {
    std::string result;
    result.reserve(value.size());

    for (size_t i = 0; i < value.length(); ++i) {
        if (value[i] != '%') {
            result.push_back(value[i]);
            continue;
        }

        if (i + 2 >= value.length()) throw std::invalid_argument("Invalid percent-encoding in URL");
        const int hi = hexValue(value[i + 1]), lo = hexValue(value[i + 2]);
        if (hi < 0 || lo < 0) throw std::invalid_argument("Invalid percent-encoding in URL");
        result.push_back(static_cast<char>(hi * 16 + lo));
        i += 2;
    }

    return result;
}

std::vector<std::string> split_path(std::string_view target) {
    if (const auto q = target.find('?'); q != std::string_view::npos) target = target.substr(0, q);

    std::vector<std::string> segments;
    size_t start = 0;
    while (start <= target.size()) {
        const auto end = target.find('/', start);
        const auto seg = target.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);
        if (!seg.empty()) segments.emplace_back(seg);
        if (end == std::string_view::npos) break;
        start = end + 1;
    }
    return segments;
}

}
