#include "config/ConfigRegistry.hpp"

#include <stdexcept>

namespace nf::config {

void ConfigRegistry::init() {
    std::call_once(init_flag_, [&]() {
        config_ = loadConfigFromEnv();
        initialized_ = true;
    });
}

void ConfigRegistry::init(const Config& config) {
    std::call_once(init_flag_, [&]() {
        config_ = config;
        initialized_ = true;
    });
}

const Config& ConfigRegistry::get() {
    ensureInitialized();
    return config_;
}

void ConfigRegistry::ensureInitialized() {
    if (!initialized_)
        throw std::runtime_error("ConfigRegistry accessed before initialization. Call ConfigRegistry::init() first.");
}

} // namespace nf::config
