#include "backend_factory.hpp"
#include "postgres/postgres_backend.hpp"
#include "../utils/logger.hpp"

#ifdef CACHEX_HAS_HIREDIS
#include "redis/redis_backend.hpp"
#endif

namespace cachex {

std::shared_ptr<CacheBackend> make_backend(const CacheConfig& cfg) {
    LOG_DBG("[cachex] Creating %s backend", backend_kind_str(cfg.backend));
    switch (cfg.backend) {
        case BackendKind::POSTGRESQL:
            return std::make_shared<PostgresBackend>(cfg);
        case BackendKind::REDIS:
#ifdef CACHEX_HAS_HIREDIS
            return std::make_shared<RedisBackend>(cfg);
#else
            LOG_ERR("[redis] hiredis not available, Redis backend disabled");
            throw ConfigError("backend 'redis' is not available (built without hiredis)");
#endif
    }
    throw ConfigError("unknown backend kind");
}

} // namespace cachex
