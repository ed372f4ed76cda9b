#include "config/ConfigRegistry.hpp"

#include <stdexcept>

namespace rf::config {

void ConfigRegistry::init(Config config) {
    config.validate();
    std::call_once(init_flag_, [&config]() {
        config_ = std::move(config);
        initialized_ = true;
    });
}

const Config& ConfigRegistry::get() {
    ensureInitialized();
    return config_;
}

bool ConfigRegistry::isInitialized() { return initialized_; }

void ConfigRegistry::ensureInitialized() {
    if (!initialized_)
        throw std::runtime_error("ConfigRegistry accessed before initialization. Call ConfigRegistry::init() first.");
}

}
