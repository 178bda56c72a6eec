#pragma once
#include <cstdint>
#include <fstream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "errors.hpp"
#include "utils/logger.hpp"

namespace cachex {

// Storage strategy behind the cache interface
enum class BackendKind { POSTGRESQL, REDIS };

inline const char* backend_kind_str(BackendKind b) {
    switch (b) {
        case BackendKind::POSTGRESQL: return "postgresql";
        case BackendKind::REDIS:      return "redis";
    }
    return "??";
}

inline BackendKind parse_backend_kind(const std::string& s) {
    if (s == "postgresql" || s == "postgres") return BackendKind::POSTGRESQL;
    if (s == "redis") return BackendKind::REDIS;
    throw ConfigError("unknown backend '" + s + "' (valid: postgresql, redis)");
}

// Relational emulation settings
struct PostgresConfig {
    std::string host = "localhost";
    uint16_t port = 5432;
    std::string user = "postgres";
    std::string password;
    std::string database = "postgres";
    std::string conninfo;           // Raw libpq string; overrides the fields above
    std::string schema;             // Optional schema qualifier for the tables
    std::string table = "cachex";   // Registry table; aux tables get _hashes, _lists, ...
    int pool_size = 4;
    int connect_timeout = 10;       // Seconds
    std::string application_name = "cachex";
    bool unlogged = true;

    [[nodiscard]] std::string connection_string() const;
};

// Native engine settings (hiredis)
struct RedisConfig {
    std::string host = "localhost";
    uint16_t port = 6379;
    std::string user;       // Redis 6+ ACL user
    std::string password;
    int db = 0;
    int connect_timeout = 10;
};

// Value codec chain; first entry encodes, all entries are tried on decode
struct CodecConfig {
    std::vector<std::string> serializers = {"json"};
    std::vector<std::string> compressors;
    size_t min_length = 256;    // Payloads at or below this size stay uncompressed
    int zlib_level = 6;
    uint32_t lzma_preset = 4;
};

struct CacheConfig {
    BackendKind backend = BackendKind::POSTGRESQL;
    PostgresConfig postgresql;
    RedisConfig redis;
    CodecConfig codec;
    int64_t scan_itersize = 100;
    int async_workers = 4;

    static CacheConfig defaults() { return CacheConfig{}; }
    static CacheConfig from_json(const std::string& path);
    static CacheConfig from_json_object(const nlohmann::json& j);
};

inline std::string PostgresConfig::connection_string() const {
    if (!conninfo.empty()) return conninfo;

    // libpq keyword/value syntax: quote values and escape ' and backslash
    auto quote = [](const std::string& v) {
        std::string out = "'";
        for (char c : v) {
            if (c == '\'' || c == '\\') out += '\\';
            out += c;
        }
        out += '\'';
        return out;
    };

    std::string s = "host=" + quote(host) + " port=" + std::to_string(port) +
                    " dbname=" + quote(database) + " user=" + quote(user);
    if (!password.empty()) s += " password=" + quote(password);
    s += " connect_timeout=" + std::to_string(connect_timeout);
    s += " application_name=" + quote(application_name);
    return s;
}

inline CacheConfig CacheConfig::from_json_object(const nlohmann::json& j) {
    CacheConfig cfg;
    try {
        if (j.contains("backend")) cfg.backend = parse_backend_kind(j["backend"].get<std::string>());
        cfg.scan_itersize = j.value("scan_itersize", cfg.scan_itersize);
        cfg.async_workers = j.value("async_workers", cfg.async_workers);

        if (j.contains("postgresql")) {
            const auto& p = j["postgresql"];
            cfg.postgresql.host = p.value("host", cfg.postgresql.host);
            cfg.postgresql.port = p.value("port", cfg.postgresql.port);
            cfg.postgresql.user = p.value("user", cfg.postgresql.user);
            cfg.postgresql.password = p.value("password", cfg.postgresql.password);
            cfg.postgresql.database = p.value("database", cfg.postgresql.database);
            cfg.postgresql.conninfo = p.value("conninfo", cfg.postgresql.conninfo);
            cfg.postgresql.schema = p.value("schema", cfg.postgresql.schema);
            cfg.postgresql.table = p.value("table", cfg.postgresql.table);
            cfg.postgresql.pool_size = p.value("pool_size", cfg.postgresql.pool_size);
            cfg.postgresql.connect_timeout = p.value("connect_timeout", cfg.postgresql.connect_timeout);
            cfg.postgresql.application_name = p.value("application_name", cfg.postgresql.application_name);
            cfg.postgresql.unlogged = p.value("unlogged", cfg.postgresql.unlogged);
        }

        if (j.contains("redis")) {
            const auto& r = j["redis"];
            cfg.redis.host = r.value("host", cfg.redis.host);
            cfg.redis.port = r.value("port", cfg.redis.port);
            cfg.redis.user = r.value("user", cfg.redis.user);
            cfg.redis.password = r.value("password", cfg.redis.password);
            cfg.redis.db = r.value("db", cfg.redis.db);
            cfg.redis.connect_timeout = r.value("connect_timeout", cfg.redis.connect_timeout);
        }

        if (j.contains("codec")) {
            const auto& c = j["codec"];
            if (c.contains("serializers")) {
                cfg.codec.serializers = c["serializers"].get<std::vector<std::string>>();
            }
            if (c.contains("compressors")) {
                cfg.codec.compressors = c["compressors"].get<std::vector<std::string>>();
            }
            cfg.codec.min_length = c.value("min_length", cfg.codec.min_length);
            cfg.codec.zlib_level = c.value("zlib_level", cfg.codec.zlib_level);
            cfg.codec.lzma_preset = c.value("lzma_preset", cfg.codec.lzma_preset);
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("invalid configuration: ") + e.what());
    }

    if (cfg.scan_itersize <= 0) throw ConfigError("scan_itersize must be positive");
    if (cfg.async_workers <= 0) throw ConfigError("async_workers must be positive");
    if (cfg.postgresql.pool_size <= 0) throw ConfigError("postgresql.pool_size must be positive");
    if (cfg.codec.serializers.empty()) throw ConfigError("codec.serializers must not be empty");
    return cfg;
}

inline CacheConfig CacheConfig::from_json(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        LOG_WRN("[config] %s not found, using defaults", path.c_str());
        return defaults();
    }

    nlohmann::json j;
    try {
        f >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("cannot parse " + path + ": " + e.what());
    }
    return from_json_object(j);
}

} // namespace cachex
