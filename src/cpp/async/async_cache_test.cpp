#include "async_cache.hpp"
#include <gtest/gtest.h>
#include "../backends/postgres/pg_test_fixture.hpp"

namespace cachex {

class AsyncCacheTest : public PgTest {
protected:
    void SetUp() override {
        PgTest::SetUp();
        if (IsSkipped()) return;
        backend_ = std::make_shared<PostgresBackend>(pg_test_config());
        async_ = std::make_unique<AsyncCache>(backend_, 3);
    }

    void TearDown() override {
        async_.reset();
        PgTest::TearDown();
    }

    std::shared_ptr<PostgresBackend> backend_;
    std::unique_ptr<AsyncCache> async_;
};

TEST_F(AsyncCacheTest, SetThenGet) {
    async_->set("k", Value::object({{"a", 1}})).get();
    auto got = async_->get("k").get();
    ASSERT_TRUE(got);
    EXPECT_EQ((*got)["a"], Value(1));
    EXPECT_EQ(async_->workers(), 3u);
}

TEST_F(AsyncCacheTest, ArgumentsAreCopied) {
    std::future<int64_t> pushed;
    {
        std::string key = "list";
        ValueList values = {1, 2, 3};
        pushed = async_->rpush(key, values);
    }
    EXPECT_EQ(pushed.get(), 3);
    EXPECT_EQ(async_->lrange("list", 0, -1).get(), (ValueList{1, 2, 3}));
}

TEST_F(AsyncCacheTest, ConcurrentIncrementsSerialize) {
    async_->set("n", 0).get();
    std::vector<std::future<int64_t>> futures;
    for (int i = 0; i < 30; i++) futures.push_back(async_->incr("n"));
    for (auto& f : futures) f.get();
    EXPECT_EQ(*async_->get("n").get(), Value(30));
}

TEST_F(AsyncCacheTest, ErrorsReachTheFuture) {
    auto f = async_->incr("missing");
    EXPECT_THROW(f.get(), PreconditionError);
    auto g = async_->eval("return 1", {}, {});
    EXPECT_THROW(g.get(), NotSupportedError);
}

TEST_F(AsyncCacheTest, SubmitRunsArbitraryWork) {
    auto f = async_->submit([](CacheBackend& b) {
        b.sadd("s", {1, 2, 3});
        return b.scard("s");
    });
    EXPECT_EQ(f.get(), 3);
}

TEST_F(AsyncCacheTest, IterKeysCollectsAll) {
    for (int i = 0; i < 5; i++) async_->set("it:" + std::to_string(i), i).get();
    EXPECT_EQ(async_->iter_keys("it:*", 2).get().size(), 5u);
}

TEST_F(AsyncCacheTest, ZsetFamily) {
    async_->zadd("z", {{Value("a"), 1}, {Value("b"), 2}}).get();
    EXPECT_EQ(async_->zrange("z", 0, -1).get(), (ValueList{"a", "b"}));
    EXPECT_EQ(async_->zscore("z", "b").get(), 2.0);
}

TEST(AsyncCacheConfigTest, NullBackendRejected) {
    EXPECT_THROW(AsyncCache(nullptr, 1), ConfigError);
}

TEST(AsyncCacheConfigTest, BuildsFromConfig) {
    auto cfg = CacheConfig::defaults();
    cfg.async_workers = 2;
    AsyncCache cache(cfg);
    EXPECT_EQ(cache.workers(), 2u);
    EXPECT_STREQ(cache.backend().backend_name(), "postgresql");
}

} // namespace cachex
