#include "async_cache.hpp"
#include "../backends/backend_factory.hpp"
#include "../utils/logger.hpp"

namespace cachex {

AsyncCache::AsyncCache(std::shared_ptr<CacheBackend> backend, size_t workers)
    : backend_(std::move(backend)), pool_(workers) {
    if (!backend_) throw ConfigError("AsyncCache needs a backend");
    LOG_DBG("[async] %zu workers over %s", workers, backend_->backend_name());
}

AsyncCache::AsyncCache(const CacheConfig& cfg)
    : AsyncCache(make_backend(cfg), static_cast<size_t>(cfg.async_workers)) {}

} // namespace cachex
