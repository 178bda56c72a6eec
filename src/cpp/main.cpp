// =============================================================================
// cachex-admin -- maintenance tool for the relational cache layout
//
// Creates or drops the registry and auxiliary tables, sweeps expired keys
// and reports storage usage. Only the PostgreSQL strategy keeps a persisted
// layout; --keys works against either backend.
// =============================================================================

#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>

#include "config.hpp"
#include "errors.hpp"
#include "utils/logger.hpp"
#include "utils/timer.hpp"
#include "backends/backend_factory.hpp"
#include "backends/postgres/postgres_backend.hpp"

static void print_usage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s [OPTIONS]\n"
        "\n"
        "Options:\n"
        "  --config PATH       JSON config file (default: local defaults)\n"
        "  --migrate           Create the cache tables and indexes\n"
        "  --drop              Drop the cache tables\n"
        "  --purge-expired     Delete every expired key\n"
        "  --stats             Print key counts per type and relation size\n"
        "  --keys PATTERN      List live keys matching a glob pattern\n"
        "  --verbose           Enable debug logging\n"
        "  --help              Show this help\n"
        "\n"
        "Actions run in the order listed above.\n",
        prog);
}

static cachex::PostgresBackend& require_postgres(cachex::CacheBackend& backend, const char* action) {
    auto* pg = dynamic_cast<cachex::PostgresBackend*>(&backend);
    if (!pg) throw cachex::NotSupportedError(action, backend.backend_name());
    return *pg;
}

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string keys_pattern;
    bool migrate = false;
    bool drop = false;
    bool purge = false;
    bool stats = false;
    bool list_keys = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--migrate") == 0) {
            migrate = true;
        } else if (std::strcmp(argv[i], "--drop") == 0) {
            drop = true;
        } else if (std::strcmp(argv[i], "--purge-expired") == 0) {
            purge = true;
        } else if (std::strcmp(argv[i], "--stats") == 0) {
            stats = true;
        } else if (std::strcmp(argv[i], "--keys") == 0 && i + 1 < argc) {
            keys_pattern = argv[++i];
            list_keys = true;
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            cachex::g_log_level = cachex::LogLevel::DEBUG;
        } else {
            std::fprintf(stderr, "Unknown option: %s\n", argv[i]);
            print_usage(argv[0]);
            return 1;
        }
    }

    if (!migrate && !drop && !purge && !stats && !list_keys) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        cachex::CacheConfig cfg = config_path.empty()
            ? cachex::CacheConfig::defaults()
            : cachex::CacheConfig::from_json(config_path);

        auto backend = cachex::make_backend(cfg);
        LOG_INF("[admin] backend: %s", backend->backend_name());
        cachex::Timer timer;

        if (migrate) {
            auto& pg = require_postgres(*backend, "migrate");
            pg.create_schema();
            LOG_INF("[admin] schema created for table %s", cfg.postgresql.table.c_str());
        }

        if (drop) {
            auto& pg = require_postgres(*backend, "drop");
            pg.drop_schema();
            LOG_INF("[admin] schema dropped for table %s", cfg.postgresql.table.c_str());
        }

        if (purge) {
            auto& pg = require_postgres(*backend, "purge-expired");
            int64_t n = pg.purge_expired();
            std::printf("purged %lld expired keys\n", static_cast<long long>(n));
        }

        if (stats) {
            auto& pg = require_postgres(*backend, "stats");
            cachex::StorageStats s = pg.storage_stats();
            int64_t total = 0;
            for (auto t : {cachex::KeyType::STRING, cachex::KeyType::HASH, cachex::KeyType::LIST,
                           cachex::KeyType::SET, cachex::KeyType::ZSET}) {
                auto it = s.live_keys.find(t);
                int64_t n = it == s.live_keys.end() ? 0 : it->second;
                total += n;
                std::printf("%-8s %lld\n", cachex::key_type_str(t), static_cast<long long>(n));
            }
            std::printf("%-8s %lld\n", "live", static_cast<long long>(total));
            std::printf("%-8s %lld\n", "expired", static_cast<long long>(s.expired_keys));
            std::printf("%-8s %lld\n", "bytes", static_cast<long long>(s.total_bytes));
        }

        if (list_keys) {
            size_t n = 0;
            for (const auto& key : backend->iter_keys(keys_pattern)) {
                std::printf("%s\n", key.c_str());
                n++;
            }
            LOG_INF("[admin] %zu keys match '%s'", n, keys_pattern.c_str());
        }

        LOG_DBG("[admin] done in %.1f ms", timer.elapsed_ms());
    } catch (const cachex::ConfigError& e) {
        LOG_ERR("[admin] configuration: %s", e.what());
        return 2;
    } catch (const cachex::CacheError& e) {
        LOG_ERR("[admin] %s", e.what());
        return 1;
    }
    return 0;
}
