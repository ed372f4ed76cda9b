#pragma once

#include <optional>
#include <string_view>

namespace rf::util {

// Digits only, no sign, no whitespace; nullopt on overflow.
std::optional<unsigned int> parseUInt(std::string_view sv);

// Plain decimal or exponent notation, fully consumed; nullopt on anything else.
std::optional<double> parseDouble(std::string_view sv);

}
