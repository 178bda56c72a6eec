#include "config.hpp"
#include <cstdio>
#include <fstream>
#include <gtest/gtest.h>

namespace cachex {

TEST(ConfigTest, Defaults) {
    auto cfg = CacheConfig::defaults();
    EXPECT_EQ(cfg.backend, BackendKind::POSTGRESQL);
    EXPECT_EQ(cfg.scan_itersize, 100);
    EXPECT_EQ(cfg.async_workers, 4);
    EXPECT_EQ(cfg.postgresql.table, "cachex");
    EXPECT_TRUE(cfg.postgresql.unlogged);
    EXPECT_EQ(cfg.codec.serializers, std::vector<std::string>{"json"});
    EXPECT_TRUE(cfg.codec.compressors.empty());
    EXPECT_EQ(cfg.codec.min_length, 256u);
}

TEST(ConfigTest, ParsesObject) {
    auto j = nlohmann::json::parse(R"({
        "backend": "redis",
        "scan_itersize": 50,
        "async_workers": 2,
        "postgresql": {"host": "db", "port": 6543, "table": "kv", "pool_size": 8, "unlogged": false},
        "redis": {"host": "cache", "db": 3},
        "codec": {"serializers": ["msgpack", "json"], "compressors": ["lzma"], "min_length": 16}
    })");
    auto cfg = CacheConfig::from_json_object(j);
    EXPECT_EQ(cfg.backend, BackendKind::REDIS);
    EXPECT_EQ(cfg.scan_itersize, 50);
    EXPECT_EQ(cfg.async_workers, 2);
    EXPECT_EQ(cfg.postgresql.host, "db");
    EXPECT_EQ(cfg.postgresql.port, 6543);
    EXPECT_EQ(cfg.postgresql.table, "kv");
    EXPECT_EQ(cfg.postgresql.pool_size, 8);
    EXPECT_FALSE(cfg.postgresql.unlogged);
    EXPECT_EQ(cfg.redis.host, "cache");
    EXPECT_EQ(cfg.redis.db, 3);
    EXPECT_EQ(cfg.redis.port, 6379);
    EXPECT_EQ(cfg.codec.serializers.front(), "msgpack");
    EXPECT_EQ(cfg.codec.compressors, std::vector<std::string>{"lzma"});
    EXPECT_EQ(cfg.codec.min_length, 16u);
}

TEST(ConfigTest, RejectsInvalidValues) {
    EXPECT_THROW(CacheConfig::from_json_object(nlohmann::json::parse(R"({"backend": "memcached"})")),
                 ConfigError);
    EXPECT_THROW(CacheConfig::from_json_object(nlohmann::json::parse(R"({"scan_itersize": 0})")),
                 ConfigError);
    EXPECT_THROW(CacheConfig::from_json_object(nlohmann::json::parse(R"({"async_workers": -1})")),
                 ConfigError);
    EXPECT_THROW(CacheConfig::from_json_object(nlohmann::json::parse(R"({"postgresql": {"port": "x"}})")),
                 ConfigError);
    EXPECT_THROW(CacheConfig::from_json_object(nlohmann::json::parse(R"({"codec": {"serializers": []}})")),
                 ConfigError);
}

TEST(ConfigTest, MissingFileGivesDefaults) {
    auto cfg = CacheConfig::from_json("/nonexistent/cachex.json");
    EXPECT_EQ(cfg.scan_itersize, 100);
}

TEST(ConfigTest, LoadsFile) {
    std::string path = ::testing::TempDir() + "cachex_config_test.json";
    {
        std::ofstream f(path);
        f << R"({"postgresql": {"conninfo": "dbname=x"}})";
    }
    auto cfg = CacheConfig::from_json(path);
    EXPECT_EQ(cfg.postgresql.connection_string(), "dbname=x");
    std::remove(path.c_str());
}

TEST(ConfigTest, UnparsableFileThrows) {
    std::string path = ::testing::TempDir() + "cachex_config_bad.json";
    {
        std::ofstream f(path);
        f << "{ backend: ";
    }
    EXPECT_THROW(CacheConfig::from_json(path), ConfigError);
    std::remove(path.c_str());
}

TEST(ConfigTest, ConnectionStringQuotesValues) {
    PostgresConfig pg;
    pg.password = "it's";
    std::string s = pg.connection_string();
    EXPECT_NE(s.find("password='it\\'s'"), std::string::npos);
    EXPECT_NE(s.find("host='localhost'"), std::string::npos);
    EXPECT_NE(s.find("port=5432"), std::string::npos);
}

} // namespace cachex
