#include "cache_backend.hpp"
#include <limits>
#include <gtest/gtest.h>
#include "backend_factory.hpp"
#include "postgres/postgres_backend.hpp"

namespace cachex {

// The connection pool opens lazily, so the relational strategy can be built
// without a server for the surface that never reaches it.
class NotSupportedTest : public ::testing::Test {
protected:
    NotSupportedTest() : backend_(PostgresConfig{}, CodecConfig{}) {}

    template <typename F>
    void expect_not_supported(const char* op, F&& fn) {
        try {
            fn();
            ADD_FAILURE() << op << " did not throw";
        } catch (const NotSupportedError& e) {
            EXPECT_EQ(e.operation(), op);
            EXPECT_EQ(e.backend(), "postgresql");
            EXPECT_NE(std::string(e.what()).find(op), std::string::npos);
            EXPECT_NE(std::string(e.what()).find("postgresql"), std::string::npos);
        }
    }

    PostgresBackend backend_;
};

TEST_F(NotSupportedTest, Streams) {
    expect_not_supported("xadd", [&] { backend_.xadd("s", {{"f", "v"}}); });
    expect_not_supported("xlen", [&] { backend_.xlen("s"); });
    expect_not_supported("xrange", [&] { backend_.xrange("s"); });
    expect_not_supported("xrevrange", [&] { backend_.xrevrange("s"); });
    expect_not_supported("xread", [&] { backend_.xread({{"s", "0"}}); });
    expect_not_supported("xtrim", [&] { backend_.xtrim("s", 10); });
    expect_not_supported("xdel", [&] { backend_.xdel("s", {"1-0"}); });
    expect_not_supported("xgroup_create", [&] { backend_.xgroup_create("s", "g"); });
    expect_not_supported("xgroup_destroy", [&] { backend_.xgroup_destroy("s", "g"); });
    expect_not_supported("xreadgroup", [&] { backend_.xreadgroup("g", "c", {{"s", ">"}}); });
    expect_not_supported("xack", [&] { backend_.xack("s", "g", {"1-0"}); });
}

TEST_F(NotSupportedTest, ScriptingBlockingAndServer) {
    expect_not_supported("eval", [&] { backend_.eval("return 1", {}, {}); });
    expect_not_supported("blpop", [&] { backend_.blpop({"l"}, 0.1); });
    expect_not_supported("brpop", [&] { backend_.brpop({"l"}, 0.1); });
    expect_not_supported("blmove", [&] { backend_.blmove("a", "b", ListEnd::LEFT, ListEnd::RIGHT, 0.1); });
    expect_not_supported("sscan", [&] { backend_.sscan("s", 0); });
    expect_not_supported("lock", [&] { backend_.lock("name"); });
    expect_not_supported("info", [&] { backend_.info(); });
    expect_not_supported("slowlog_get", [&] { backend_.slowlog_get(); });
    expect_not_supported("slowlog_len", [&] { backend_.slowlog_len(); });
}

TEST_F(NotSupportedTest, IsACacheError) {
    EXPECT_THROW(backend_.eval("return 1", {}, {}), CacheError);
}

// Rejected before the engine is contacted, so no server is needed
TEST_F(NotSupportedTest, DecrOfLowestDeltaIsPrecondition) {
    EXPECT_THROW(backend_.decr("n", std::numeric_limits<int64_t>::min()), PreconditionError);
}

TEST(BackendFactoryTest, BuildsRelationalStrategy) {
    auto backend = make_backend(CacheConfig::defaults());
    ASSERT_TRUE(backend);
    EXPECT_STREQ(backend->backend_name(), "postgresql");
    EXPECT_EQ(backend->scan_itersize(), 100);
}

TEST(BackendFactoryTest, InvalidTableNameIsConfigError) {
    auto cfg = CacheConfig::defaults();
    cfg.postgresql.table = "no spaces allowed";
    EXPECT_THROW(make_backend(cfg), ConfigError);
}

#ifndef CACHEX_HAS_HIREDIS
TEST(BackendFactoryTest, RedisWithoutHiredisIsConfigError) {
    auto cfg = CacheConfig::defaults();
    cfg.backend = BackendKind::REDIS;
    EXPECT_THROW(make_backend(cfg), ConfigError);
}
#endif

} // namespace cachex
