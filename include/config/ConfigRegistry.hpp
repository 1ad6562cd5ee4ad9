#pragma once

#include "config/Config.hpp"

#include <mutex>

namespace nf::config {

class ConfigRegistry {
public:
    static void init();
    static void init(const Config& config);
    static const Config& get();

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline bool initialized_ = false;
    static inline std::once_flag init_flag_;
};

} // namespace nf::config
