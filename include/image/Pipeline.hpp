#pragma once

#include "image/model/EncodeConfig.hpp"
#include "image/model/Encoding.hpp"
#include "image/model/ResizeSpec.hpp"

#include <filesystem>

namespace rf::image {

// load -> resize -> encode, strictly in order. Holds nothing but its config, so one
// instance can be shared by any number of threads.
class Pipeline {
public:
    explicit Pipeline(model::EncodeConfig config);

    // Throws NotFound or FailedToResize; the first failure aborts the remaining stages.
    [[nodiscard]] model::Encoded process(const std::filesystem::path& source,
                                         const model::ResizeSpec& to,
                                         model::Encoding encoding) const;

    [[nodiscard]] const model::EncodeConfig& config() const noexcept { return config_; }

private:
    model::EncodeConfig config_;
};

}
