#include "config/ConfigRegistry.hpp"

#include <stdexcept>

namespace hl::config {

void ConfigRegistry::init(const std::filesystem::path& path) {
    init(loadConfig(path));
}

void ConfigRegistry::init(Config config) {
    std::scoped_lock lock(mutex_);
    config_ = std::move(config);
    initialized_ = true;
}

const Config& ConfigRegistry::get() {
    ensureInitialized();
    return config_;
}

Config& ConfigRegistry::mutate() {
    ensureInitialized();
    return config_;
}

void ConfigRegistry::ensureInitialized() {
    if (!initialized_)
        throw std::runtime_error("ConfigRegistry accessed before initialization. Call ConfigRegistry::init() first.");
}

} // namespace hl::config
