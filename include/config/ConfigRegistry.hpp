#pragma once

#include "config/Config.hpp"

#include <mutex>

namespace rf::config {

// Process-wide configuration. Frozen by init(), read-only afterwards.
class ConfigRegistry {
public:
    static void init(Config config);
    static const Config& get();
    [[nodiscard]] static bool isInitialized();

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline bool initialized_ = false;
    static inline std::once_flag init_flag_;
};

}
