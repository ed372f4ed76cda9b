#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace rf::image {

class Error : public std::runtime_error {
public:
    enum class Kind { NotFound, FailedToResize };

    Error(const Kind kind, const std::string& what) : std::runtime_error(what), kind_(kind) {}

    [[nodiscard]] Kind kind() const noexcept { return kind_; }

private:
    Kind kind_;
};

// Source missing, unreadable or not a decodable image.
class NotFound final : public Error {
public:
    NotFound() : Error(Kind::NotFound, "image not found") {}
};

// Any failure during dimension resolution, resampling or encoding.
class FailedToResize final : public Error {
public:
    explicit FailedToResize(std::string detail)
        : Error(Kind::FailedToResize, "failed to resize: " + detail), detail_(std::move(detail)) {}

    [[nodiscard]] const std::string& detail() const noexcept { return detail_; }

private:
    std::string detail_;
};

}
