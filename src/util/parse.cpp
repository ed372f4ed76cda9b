#include "util/parse.hpp"

#include <cerrno>
#include <cstdlib>
#include <limits>
#include <string>

std::optional<unsigned int> rf::util::parseUInt(const std::string_view sv) {
    if (sv.empty()) return std::nullopt;

    unsigned long long v = 0; // wide enough for overflow check
    for (const char c : sv) {
        if (c < '0' || c > '9') return std::nullopt;
        v = v * 10 + static_cast<unsigned>(c - '0');
        if (v > std::numeric_limits<unsigned int>::max()) return std::nullopt;
    }

    return static_cast<unsigned int>(v);
}

std::optional<double> rf::util::parseDouble(const std::string_view sv) {
    if (sv.empty() || sv.front() == ' ' || sv.front() == '\t') return std::nullopt;

    const std::string s(sv);
    char* end = nullptr;
    errno = 0;
    const double v = std::strtod(s.c_str(), &end);
    if (end != s.c_str() + s.size() || errno == ERANGE) return std::nullopt;
    return v;
}
