#include "pg_test_fixture.hpp"
#include <algorithm>
#include <limits>
#include <set>
#include <thread>

namespace cachex {

// --- Strings ---

TEST_F(PgTest, RoundTripKeepsKinds) {
    const std::vector<Value> values = {
        Value(42), Value(-1), Value(true), Value(false), Value(3.25), Value("123"), Value("text"),
        Value::object({{"a", 1}, {"b", Value::array({1, 2, Value::object({{"c", nullptr}})})}}),
    };
    for (size_t i = 0; i < values.size(); i++) {
        std::string key = "rt:" + std::to_string(i);
        cache_->set(key, values[i]);
        auto got = cache_->get(key);
        ASSERT_TRUE(got) << key;
        EXPECT_EQ(*got, values[i]);
        EXPECT_EQ(got->type(), values[i].type()) << values[i].dump();
    }
}

TEST_F(PgTest, GetMissingIsNullopt) {
    EXPECT_FALSE(cache_->get("missing"));
    EXPECT_FALSE(cache_->has_key("missing"));
    EXPECT_FALSE(cache_->type("missing"));
}

TEST_F(PgTest, ZeroTimeoutDeletes) {
    cache_->set("k", "v");
    cache_->set("k", "w", 0.0);
    EXPECT_FALSE(cache_->has_key("k"));
}

TEST_F(PgTest, AddOnlyWhenAbsent) {
    EXPECT_TRUE(cache_->add("k", 1));
    EXPECT_FALSE(cache_->add("k", 2));
    EXPECT_EQ(*cache_->get("k"), Value(1));
}

TEST_F(PgTest, AddReplacesExpiredKey) {
    cache_->set("k", "old", 0.05);
    sleep_ms(120);
    EXPECT_TRUE(cache_->add("k", "new"));
    EXPECT_EQ(*cache_->get("k"), Value("new"));
}

TEST_F(PgTest, SetNxXx) {
    cache_->set("k", "a");
    SetFlags nx;
    nx.nx = true;
    EXPECT_FALSE(cache_->set_with_flags("k", "b", std::nullopt, nx).applied);
    EXPECT_EQ(*cache_->get("k"), Value("a"));

    SetFlags xx;
    xx.xx = true;
    EXPECT_TRUE(cache_->set_with_flags("k", "c", std::nullopt, xx).applied);
    EXPECT_EQ(*cache_->get("k"), Value("c"));

    EXPECT_FALSE(cache_->set_with_flags("absent", "c", std::nullopt, xx).applied);
    EXPECT_FALSE(cache_->has_key("absent"));
}

TEST_F(PgTest, SetWithGetReturnsPrevious) {
    SetFlags get;
    get.get = true;
    auto first = cache_->set_with_flags("k", "a", std::nullopt, get);
    EXPECT_TRUE(first.applied);
    EXPECT_FALSE(first.previous);

    auto second = cache_->set_with_flags("k", "b", std::nullopt, get);
    ASSERT_TRUE(second.previous);
    EXPECT_EQ(*second.previous, Value("a"));

    get.nx = true;
    auto third = cache_->set_with_flags("k", "c", std::nullopt, get);
    EXPECT_FALSE(third.applied);
    EXPECT_EQ(*third.previous, Value("b"));
}

TEST_F(PgTest, NxDoesNotDisplaceOtherTypes) {
    cache_->hset("h", "f", 1);
    SetFlags nx;
    nx.nx = true;
    EXPECT_FALSE(cache_->set_with_flags("h", "x", std::nullopt, nx).applied);
    EXPECT_EQ(cache_->type("h"), KeyType::HASH);
}

TEST_F(PgTest, SetOverwritesCollection) {
    cache_->rpush("l", {1, 2});
    cache_->set("l", "plain");
    EXPECT_EQ(cache_->type("l"), KeyType::STRING);
    EXPECT_EQ(cache_->llen("l"), 0);
}

TEST_F(PgTest, Delete) {
    cache_->set("k", 1);
    EXPECT_TRUE(cache_->del("k"));
    EXPECT_FALSE(cache_->del("k"));
}

TEST_F(PgTest, ManyKeys) {
    cache_->set_many({{"a", 1}, {"b", "two"}, {"c", Value::array({3})}});
    cache_->hset("h", "f", 1);
    auto got = cache_->get_many({"a", "b", "missing", "h"});
    EXPECT_EQ(got.size(), 2u);
    EXPECT_EQ(got["a"], Value(1));
    EXPECT_EQ(got["b"], Value("two"));
    EXPECT_EQ(cache_->delete_many({"a", "b", "c", "missing"}), 3);
}

TEST_F(PgTest, Incr) {
    cache_->set("n", 10);
    EXPECT_EQ(cache_->incr("n"), 11);
    EXPECT_EQ(cache_->incr("n", 5), 16);
    EXPECT_EQ(cache_->decr("n", 20), -4);
    EXPECT_EQ(*cache_->get("n"), Value(-4));
}

TEST_F(PgTest, PreconditionFailureIsLoggedAtError) {
    cache_->set("s", "abc");
    ::testing::internal::CaptureStderr();
    EXPECT_THROW(cache_->incr("s"), PreconditionError);
    EXPECT_THROW(cache_->lset("missing", 0, 1), IndexOutOfRangeError);
    std::string log = ::testing::internal::GetCapturedStderr();
    EXPECT_NE(log.find("[postgresql] incr failed"), std::string::npos);
    EXPECT_NE(log.find("[postgresql] lset failed"), std::string::npos);
}

TEST_F(PgTest, IncrPreconditions) {
    EXPECT_THROW(cache_->incr("missing"), PreconditionError);
    cache_->set("s", "abc");
    cache_->set("f", 1.5);
    cache_->set("b", true);
    EXPECT_THROW(cache_->incr("s"), PreconditionError);
    EXPECT_THROW(cache_->incr("f"), PreconditionError);
    EXPECT_THROW(cache_->incr("b"), PreconditionError);

    cache_->set("max", std::numeric_limits<int64_t>::max());
    try {
        cache_->incr("max");
        FAIL() << "overflow not detected";
    } catch (const PreconditionError& e) {
        EXPECT_EQ(e.key(), "max");
    }
}

TEST_F(PgTest, ConcurrentIncrements) {
    cache_->set("counter", 0);
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; t++) {
        threads.emplace_back([this] {
            for (int i = 0; i < 25; i++) cache_->incr("counter");
        });
    }
    for (auto& t : threads) t.join();
    EXPECT_EQ(*cache_->get("counter"), Value(100));
}

TEST_F(PgTest, TypeReportsEachKind) {
    cache_->set("s", 1);
    cache_->hset("h", "f", 1);
    cache_->rpush("l", {1});
    cache_->sadd("st", {1});
    cache_->zadd("z", {{Value("m"), 1.0}});
    EXPECT_EQ(cache_->type("s"), KeyType::STRING);
    EXPECT_EQ(cache_->type("h"), KeyType::HASH);
    EXPECT_EQ(cache_->type("l"), KeyType::LIST);
    EXPECT_EQ(cache_->type("st"), KeyType::SET);
    EXPECT_EQ(cache_->type("z"), KeyType::ZSET);
}

TEST_F(PgTest, ClearRemovesEverything) {
    cache_->set("a", 1);
    cache_->sadd("s", {1});
    cache_->clear();
    EXPECT_TRUE(cache_->keys("*").empty());
    EXPECT_EQ(cache_->scard("s"), 0);
}

// --- TTL ---

TEST_F(PgTest, TtlSentinels) {
    EXPECT_EQ(cache_->ttl("missing"), kKeyAbsent);
    EXPECT_EQ(cache_->pttl("missing"), kKeyAbsent);
    EXPECT_EQ(cache_->expiretime("missing"), kKeyAbsent);
    cache_->set("k", 1);
    EXPECT_EQ(cache_->ttl("k"), std::nullopt);
    EXPECT_EQ(cache_->pttl("k"), std::nullopt);
    EXPECT_EQ(cache_->expiretime("k"), std::nullopt);
}

TEST_F(PgTest, ExpireCountsDown) {
    cache_->set("k", 1);
    EXPECT_TRUE(cache_->expire("k", 10));
    auto ttl = cache_->ttl("k");
    ASSERT_TRUE(ttl);
    EXPECT_LE(*ttl, 10);
    EXPECT_GT(*ttl, 0);

    auto pttl = cache_->pttl("k");
    ASSERT_TRUE(pttl);
    EXPECT_LE(*pttl, 10000);
    EXPECT_GT(*pttl, 9000);

    EXPECT_FALSE(cache_->expire("missing", 10));
}

TEST_F(PgTest, ExpiredKeyIsAbsent) {
    cache_->set("k", "v", 0.05);
    sleep_ms(120);
    EXPECT_FALSE(cache_->get("k"));
    EXPECT_FALSE(cache_->has_key("k"));
    EXPECT_EQ(cache_->ttl("k"), kKeyAbsent);
    EXPECT_TRUE(cache_->keys("*").empty());
}

TEST_F(PgTest, ExpiredCollectionIsAbsent) {
    cache_->rpush("l", {1, 2});
    EXPECT_TRUE(cache_->pexpire("l", 50));
    sleep_ms(120);
    EXPECT_EQ(cache_->llen("l"), 0);
    EXPECT_TRUE(cache_->lrange("l", 0, -1).empty());
    // A fresh push starts from an empty list
    EXPECT_EQ(cache_->rpush("l", {3}), 1);
    EXPECT_EQ(cache_->lrange("l", 0, -1), (ValueList{3}));
}

TEST_F(PgTest, AbsoluteExpiry) {
    cache_->set("k", 1);
    auto now = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    EXPECT_TRUE(cache_->expireat("k", now + 100));
    auto at = cache_->expiretime("k");
    ASSERT_TRUE(at);
    EXPECT_NEAR(*at, now + 100, 1);

    EXPECT_TRUE(cache_->pexpireat("k", (now + 50) * 1000));
    EXPECT_NEAR(*cache_->expiretime("k"), now + 50, 1);

    EXPECT_TRUE(cache_->expireat("k", now - 10));
    EXPECT_FALSE(cache_->has_key("k"));
}

TEST_F(PgTest, PersistIsIdempotent) {
    cache_->set("k", 1);
    EXPECT_FALSE(cache_->persist("k"));
    cache_->expire("k", 100);
    EXPECT_TRUE(cache_->persist("k"));
    EXPECT_FALSE(cache_->persist("k"));
    EXPECT_EQ(cache_->ttl("k"), std::nullopt);
    EXPECT_FALSE(cache_->persist("missing"));
}

TEST_F(PgTest, Touch) {
    cache_->set("k", 1);
    EXPECT_TRUE(cache_->touch("k", 100.0));
    EXPECT_TRUE(cache_->ttl("k"));
    EXPECT_TRUE(cache_->touch("k", std::nullopt));
    EXPECT_EQ(cache_->ttl("k"), std::nullopt);
    EXPECT_FALSE(cache_->touch("missing", 10.0));
}

TEST_F(PgTest, SetWithTimeoutStoresExpiry) {
    cache_->set("k", 1, 30.0);
    auto ttl = cache_->ttl("k");
    ASSERT_TRUE(ttl);
    EXPECT_GT(*ttl, 0);
    // Plain set clears it
    cache_->set("k", 2);
    EXPECT_EQ(cache_->ttl("k"), std::nullopt);
}

TEST_F(PgTest, PurgeExpired) {
    cache_->set("a", 1, 0.05);
    cache_->hset("b", "f", 1);
    cache_->expire("b", 0.05);
    cache_->set("c", 1);
    sleep_ms(120);

    auto before = cache_->storage_stats();
    EXPECT_EQ(before.expired_keys, 2);
    EXPECT_EQ(before.live_keys[KeyType::STRING], 1);
    EXPECT_GT(before.total_bytes, 0);

    EXPECT_EQ(cache_->purge_expired(), 2);
    EXPECT_EQ(cache_->storage_stats().expired_keys, 0);
    EXPECT_EQ(cache_->purge_expired(), 0);
}

// --- Key space ---

TEST_F(PgTest, KeysWithBracketClass) {
    for (const char* k : {"a1", "a2", "b1"}) cache_->set(k, 1);
    EXPECT_EQ(cache_->keys("a[12]"), (std::vector<std::string>{"a1", "a2"}));
    EXPECT_EQ(cache_->keys("?1"), (std::vector<std::string>{"a1", "b1"}));
    EXPECT_EQ(cache_->keys("*").size(), 3u);
    EXPECT_TRUE(cache_->keys("c*").empty());
}

TEST_F(PgTest, KeysTreatLikeWildcardsLiterally) {
    cache_->set("100%", 1);
    cache_->set("100x", 1);
    cache_->set("a_b", 1);
    cache_->set("axb", 1);
    EXPECT_EQ(cache_->keys("100%"), (std::vector<std::string>{"100%"}));
    EXPECT_EQ(cache_->keys("a_b"), (std::vector<std::string>{"a_b"}));
}

TEST_F(PgTest, ScanPages) {
    for (int i = 0; i < 25; i++) cache_->set("k" + std::to_string(100 + i), i);
    std::set<std::string> seen;
    int64_t cursor = 0;
    int pages = 0;
    do {
        auto page = cache_->scan(cursor, std::string("k*"), 10);
        seen.insert(page.keys.begin(), page.keys.end());
        cursor = page.next_cursor;
        pages++;
    } while (cursor != 0);
    EXPECT_EQ(seen.size(), 25u);
    EXPECT_EQ(pages, 3);
}

TEST_F(PgTest, ScanByType) {
    cache_->set("s", 1);
    cache_->hset("h", "f", 1);
    auto page = cache_->scan(0, std::nullopt, std::nullopt, KeyType::HASH);
    EXPECT_EQ(page.keys, (std::vector<std::string>{"h"}));
    EXPECT_EQ(page.next_cursor, 0);
}

TEST_F(PgTest, IterKeysRestarts) {
    for (int i = 0; i < 7; i++) cache_->set("it:" + std::to_string(i), i);
    cache_->set("other", 1);
    auto range = cache_->iter_keys("it:*", 3);
    std::vector<std::string> first(range.begin(), range.end());
    std::vector<std::string> second(range.begin(), range.end());
    EXPECT_EQ(first.size(), 7u);
    EXPECT_EQ(first, second);
    EXPECT_TRUE(std::is_sorted(first.begin(), first.end()));
}

TEST_F(PgTest, DeletePattern) {
    for (int i = 0; i < 12; i++) cache_->set("del:" + std::to_string(i), i);
    cache_->sadd("del:set", {1, 2});
    cache_->set("keep", 1);
    EXPECT_EQ(cache_->delete_pattern("del:*", 5), 13);
    EXPECT_EQ(cache_->keys("*"), (std::vector<std::string>{"keep"}));
    EXPECT_EQ(cache_->delete_pattern("nothing*"), 0);
}

TEST_F(PgTest, RenameMovesAuxiliaryRows) {
    cache_->hset("src", HashMap{{"a", 1}, {"b", 2}});
    cache_->set("dst", "old");
    cache_->rename("src", "dst");
    EXPECT_FALSE(cache_->has_key("src"));
    EXPECT_EQ(cache_->type("dst"), KeyType::HASH);
    EXPECT_EQ(cache_->hgetall("dst"), (HashMap{{"a", 1}, {"b", 2}}));
}

TEST_F(PgTest, RenameKeepsExpiry) {
    cache_->set("src", 1, 100.0);
    cache_->rename("src", "dst");
    EXPECT_TRUE(cache_->ttl("dst"));
}

TEST_F(PgTest, RenameMissingSourceThrows) {
    try {
        cache_->rename("missing", "x");
        FAIL() << "rename of a missing key succeeded";
    } catch (const PreconditionError& e) {
        EXPECT_EQ(e.key(), "missing");
    }
    EXPECT_THROW(cache_->renamenx("missing", "x"), PreconditionError);
}

TEST_F(PgTest, Renamenx) {
    cache_->set("a", 1);
    cache_->set("b", 2);
    EXPECT_FALSE(cache_->renamenx("a", "b"));
    EXPECT_EQ(*cache_->get("a"), Value(1));
    EXPECT_EQ(*cache_->get("b"), Value(2));

    EXPECT_TRUE(cache_->renamenx("a", "c"));
    EXPECT_FALSE(cache_->has_key("a"));
    EXPECT_EQ(*cache_->get("c"), Value(1));
}

TEST_F(PgTest, SchemaIsIdempotent) {
    cache_->set("k", 1);
    cache_->create_schema();
    EXPECT_TRUE(cache_->has_key("k"));
}

} // namespace cachex
