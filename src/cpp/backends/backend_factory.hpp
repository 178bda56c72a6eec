#pragma once
#include <memory>
#include "cache_backend.hpp"
#include "../config.hpp"

namespace cachex {

// Picks the storage strategy named by cfg.backend. Throws ConfigError when
// that strategy was not compiled in.
std::shared_ptr<CacheBackend> make_backend(const CacheConfig& cfg);

} // namespace cachex
