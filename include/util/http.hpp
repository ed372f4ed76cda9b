#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace rf::util {

// Percent-decoding for path segments; '+' stays literal. Throws std::invalid_argument
// on a malformed escape.
std::string url_decode(std::string_view value);

// "/a/b//c?x=1" -> {"a", "b", "c"}; the query string is dropped.
std::vector<std::string> split_path(std::string_view target);

}
