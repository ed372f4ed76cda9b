#include "util/files.hpp"

#include <fstream>
#include <stdexcept>

void rf::util::writeFile(const std::filesystem::path& absPath, const std::vector<uint8_t>& data) {
    std::ofstream out(absPath, std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to open output file: " + absPath.string());
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    out.close();
    if (!out) throw std::runtime_error("Failed to write output file: " + absPath.string());
}

std::optional<std::filesystem::path> rf::util::resolveUnder(const std::filesystem::path& root, const std::string& name) {
    if (name.empty() || name == "." || name == "..") return std::nullopt;
    if (name.find_first_of("/\\") != std::string::npos || name.find('\0') != std::string::npos) return std::nullopt;

    const auto base = root.lexically_normal();
    const auto candidate = (base / name).lexically_normal();
    const auto rel = candidate.lexically_relative(base);
    if (rel.empty() || *rel.begin() == "..") return std::nullopt;

    return candidate;
}
