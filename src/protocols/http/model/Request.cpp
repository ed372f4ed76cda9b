#include "protocols/http/model/Request.hpp"
#include "util/http.hpp"
#include "util/parse.hpp"

#include <stdexcept>
#include <vector>

using namespace rf::protocols::http::model;
using namespace rf::image::model;

namespace {

unsigned int dimension(const std::string& seg, const char* name) {
    if (const auto v = rf::util::parseUInt(seg)) return *v;
    throw std::invalid_argument(std::string("Invalid ") + name + ": " + seg);
}

double factor(const std::string& seg) {
    if (const auto v = rf::util::parseDouble(seg)) return *v;
    throw std::invalid_argument("Invalid scale: " + seg);
}

Encoding encodingAt(const std::vector<std::string>& segs, const size_t idx) {
    if (segs.size() <= idx) return Encoding::Avif;
    if (const auto e = parseEncoding(segs[idx])) return *e;
    throw std::invalid_argument("Unsupported encoding: " + segs[idx]);
}

}

std::optional<Request> Request::parse(const std::string_view target) {
    std::vector<std::string> segs;
    for (const auto& raw : util::split_path(target)) segs.push_back(util::url_decode(raw));

    if (segs.size() < 5 || segs.size() > 6 || segs[0] != "images" || segs[1] != "resized") return std::nullopt;

    const auto& mode = segs[2];

    if (mode == "width")
        return Request{Width{dimension(segs[3], "width")}, segs[4], encodingAt(segs, 5)};

    if (mode == "height")
        return Request{Height{dimension(segs[3], "height")}, segs[4], encodingAt(segs, 5)};

    if (mode == "scale")
        return Request{Scale{factor(segs[3])}, segs[4], encodingAt(segs, 5)};

    // /{width}/{height}/{image}[/{encoding}]
    const auto w = dimension(segs[2], "width");
    const auto h = dimension(segs[3], "height");
    return Request{WidthAndHeight{w, h}, segs[4], encodingAt(segs, 5)};
}
