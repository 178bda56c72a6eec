#include "redis_backend.hpp"
#include <cstdlib>
#include <gtest/gtest.h>

namespace cachex {

// CACHEX_TEST_REDIS_HOST=localhost; uses db 15 and flushes it around each test
class RedisTest : public ::testing::Test {
protected:
    void SetUp() override {
        const char* host = std::getenv("CACHEX_TEST_REDIS_HOST");
        if (!host) GTEST_SKIP() << "CACHEX_TEST_REDIS_HOST not set";
        RedisConfig cfg;
        cfg.host = host;
        cfg.db = 15;
        cache_ = std::make_unique<RedisBackend>(cfg, CodecConfig{});
        cache_->clear();
    }

    void TearDown() override {
        if (cache_) cache_->clear();
    }

    std::unique_ptr<RedisBackend> cache_;
};

TEST_F(RedisTest, RoundTripKeepsKinds) {
    for (const Value& v : {Value(7), Value(true), Value(2.5), Value("7"), Value::object({{"a", 1}})}) {
        cache_->set("k", v);
        auto got = cache_->get("k");
        ASSERT_TRUE(got);
        EXPECT_EQ(*got, v);
        EXPECT_EQ(got->is_string(), v.is_string());
    }
}

TEST_F(RedisTest, SetNxXxAndGet) {
    cache_->set("k", "a");
    SetFlags nx;
    nx.nx = true;
    EXPECT_FALSE(cache_->set_with_flags("k", "b", std::nullopt, nx).applied);
    SetFlags xx_get;
    xx_get.xx = true;
    xx_get.get = true;
    auto r = cache_->set_with_flags("k", "c", std::nullopt, xx_get);
    EXPECT_TRUE(r.applied);
    EXPECT_EQ(*r.previous, Value("a"));
    EXPECT_EQ(*cache_->get("k"), Value("c"));
}

TEST_F(RedisTest, IncrSemanticsMatch) {
    EXPECT_THROW(cache_->incr("missing"), PreconditionError);
    cache_->set("n", 1);
    EXPECT_EQ(cache_->incr("n", 4), 5);
    cache_->set("s", "x");
    EXPECT_THROW(cache_->incr("s"), PreconditionError);
}

TEST_F(RedisTest, TtlSentinels) {
    EXPECT_EQ(cache_->ttl("missing"), kKeyAbsent);
    cache_->set("k", 1);
    EXPECT_FALSE(cache_->ttl("k").has_value());
    EXPECT_TRUE(cache_->expire("k", 10));
    auto ttl = cache_->ttl("k");
    ASSERT_TRUE(ttl);
    EXPECT_GT(*ttl, 0);
    EXPECT_TRUE(cache_->persist("k"));
    EXPECT_FALSE(cache_->persist("k"));
}

TEST_F(RedisTest, Collections) {
    cache_->rpush("l", {10, 20, 30});
    EXPECT_EQ(cache_->linsert("l", InsertWhere::BEFORE, 20, 15), 4);
    EXPECT_EQ(cache_->lrange("l", 0, -1), (ValueList{10, 15, 20, 30}));
    EXPECT_THROW(cache_->lset("l", 10, 1), IndexOutOfRangeError);

    cache_->hset("h", HashMap{{"b", 2}, {"a", 1}});
    EXPECT_EQ(cache_->hkeys("h"), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(cache_->hincrby("h", "a", 2), 3);

    cache_->sadd("s1", {1, 2});
    cache_->sadd("s2", {2, 3});
    EXPECT_EQ(cache_->sinter({"s1", "s2"}), (ValueSet{2}));

    cache_->zadd("z", {{Value("m"), 5}});
    ZAddFlags gt;
    gt.gt = true;
    cache_->zadd("z", {{Value("m"), 3}}, gt);
    EXPECT_EQ(cache_->zscore("z", "m"), 5.0);
}

TEST_F(RedisTest, KeysAndDeletePattern) {
    for (const char* k : {"a1", "a2", "b1"}) cache_->set(k, 1);
    EXPECT_EQ(cache_->keys("a[12]"), (std::vector<std::string>{"a1", "a2"}));
    EXPECT_EQ(cache_->delete_pattern("a*"), 2);
    EXPECT_EQ(cache_->keys("*"), (std::vector<std::string>{"b1"}));
}

TEST_F(RedisTest, NativeOnlySurface) {
    EXPECT_EQ(cache_->eval("return 42", {}, {}), Value(42));
    EXPECT_FALSE(cache_->blpop({"empty"}, 0.1));
    cache_->rpush("q", {"job"});
    auto popped = cache_->blpop({"empty", "q"}, 1);
    ASSERT_TRUE(popped);
    EXPECT_EQ(popped->first, "q");
    EXPECT_EQ(popped->second, Value("job"));

    auto id = cache_->xadd("stream", {{"f", "v"}});
    EXPECT_FALSE(id.empty());
    EXPECT_EQ(cache_->xlen("stream"), 1);
    EXPECT_FALSE(cache_->info("server").empty());
}

TEST_F(RedisTest, Lock) {
    auto a = cache_->lock("L", 5.0);
    auto b = cache_->lock("L", 5.0);
    EXPECT_TRUE(a->acquire());
    EXPECT_TRUE(a->owned());
    EXPECT_FALSE(b->acquire(false));
    EXPECT_FALSE(b->acquire(true, 0.2));
    EXPECT_FALSE(b->release());
    EXPECT_TRUE(a->release());
    EXPECT_TRUE(b->acquire(false));
    EXPECT_TRUE(b->release());
}

} // namespace cachex
