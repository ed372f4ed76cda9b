#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace rf::util {

// Truncates any existing file. Throws std::runtime_error on open or write failure.
void writeFile(const std::filesystem::path& absPath, const std::vector<uint8_t>& data);

// Join a single file name onto root. nullopt when the name is empty, contains a
// separator, or would land outside root.
std::optional<std::filesystem::path> resolveUnder(const std::filesystem::path& root, const std::string& name);

}
