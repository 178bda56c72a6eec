#pragma once
// Shared fixture for suites that need a live PostgreSQL.
//
//   CACHEX_TEST_PG_CONNINFO="host=localhost dbname=cachex user=postgres"
//
// Tables are named cachex_test{,_hashes,...} and emptied around each test.
#include <chrono>
#include <cstdlib>
#include <memory>
#include <thread>
#include <gtest/gtest.h>
#include "postgres_backend.hpp"

namespace cachex {

inline CacheConfig pg_test_config() {
    CacheConfig cfg;
    const char* conninfo = std::getenv("CACHEX_TEST_PG_CONNINFO");
    if (conninfo) cfg.postgresql.conninfo = conninfo;
    cfg.postgresql.table = "cachex_test";
    cfg.postgresql.pool_size = 4;
    return cfg;
}

class PgTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!std::getenv("CACHEX_TEST_PG_CONNINFO")) {
            GTEST_SKIP() << "CACHEX_TEST_PG_CONNINFO not set";
        }
        cache_ = std::make_unique<PostgresBackend>(pg_test_config());
        cache_->create_schema();
        cache_->clear();
    }

    void TearDown() override {
        if (cache_) cache_->clear();
    }

    static void sleep_ms(int ms) { std::this_thread::sleep_for(std::chrono::milliseconds(ms)); }

    std::unique_ptr<PostgresBackend> cache_;
};

} // namespace cachex
