#pragma once
// Future-returning facade over a CacheBackend.
//
// Each call runs the synchronous operation on a worker thread, so it keeps
// exactly the transactional behavior of the blocking API. Arguments are
// copied into the task; callers may let theirs go out of scope right away.
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "worker_pool.hpp"
#include "../backends/cache_backend.hpp"
#include "../config.hpp"

namespace cachex {

class AsyncCache {
public:
    AsyncCache(std::shared_ptr<CacheBackend> backend, size_t workers = 4);
    // Backend from make_backend(cfg), cfg.async_workers threads
    explicit AsyncCache(const CacheConfig& cfg);

    [[nodiscard]] CacheBackend& backend() { return *backend_; }
    [[nodiscard]] size_t workers() const { return pool_.size(); }

    // fn(CacheBackend&) on a worker thread
    template <typename F>
    auto submit(F&& fn) {
        return pool_.submit([backend = backend_, fn = std::forward<F>(fn)]() mutable { return fn(*backend); });
    }

    // --- Strings and core ---
    std::future<void> set(std::string key, Value value, Timeout timeout = std::nullopt) {
        return submit([=](CacheBackend& b) { b.set(key, value, timeout); });
    }
    std::future<std::optional<Value>> get(std::string key) {
        return submit([=](CacheBackend& b) { return b.get(key); });
    }
    std::future<bool> add(std::string key, Value value, Timeout timeout = std::nullopt) {
        return submit([=](CacheBackend& b) { return b.add(key, value, timeout); });
    }
    std::future<SetResult> set_with_flags(std::string key, Value value, Timeout timeout, SetFlags flags) {
        return submit([=](CacheBackend& b) { return b.set_with_flags(key, value, timeout, flags); });
    }
    std::future<bool> del(std::string key) {
        return submit([=](CacheBackend& b) { return b.del(key); });
    }
    std::future<bool> has_key(std::string key) {
        return submit([=](CacheBackend& b) { return b.has_key(key); });
    }
    std::future<bool> touch(std::string key, Timeout timeout) {
        return submit([=](CacheBackend& b) { return b.touch(key, timeout); });
    }
    std::future<std::map<std::string, Value>> get_many(std::vector<std::string> keys) {
        return submit([=](CacheBackend& b) { return b.get_many(keys); });
    }
    std::future<void> set_many(std::map<std::string, Value> data, Timeout timeout = std::nullopt) {
        return submit([=](CacheBackend& b) { b.set_many(data, timeout); });
    }
    std::future<int64_t> delete_many(std::vector<std::string> keys) {
        return submit([=](CacheBackend& b) { return b.delete_many(keys); });
    }
    std::future<int64_t> incr(std::string key, int64_t delta = 1) {
        return submit([=](CacheBackend& b) { return b.incr(key, delta); });
    }
    std::future<int64_t> decr(std::string key, int64_t delta = 1) {
        return submit([=](CacheBackend& b) { return b.decr(key, delta); });
    }
    std::future<void> clear() {
        return submit([](CacheBackend& b) { b.clear(); });
    }
    std::future<std::optional<KeyType>> type(std::string key) {
        return submit([=](CacheBackend& b) { return b.type(key); });
    }

    // --- TTL ---
    std::future<std::optional<int64_t>> ttl(std::string key) {
        return submit([=](CacheBackend& b) { return b.ttl(key); });
    }
    std::future<std::optional<int64_t>> pttl(std::string key) {
        return submit([=](CacheBackend& b) { return b.pttl(key); });
    }
    std::future<std::optional<int64_t>> expiretime(std::string key) {
        return submit([=](CacheBackend& b) { return b.expiretime(key); });
    }
    std::future<bool> expire(std::string key, double seconds) {
        return submit([=](CacheBackend& b) { return b.expire(key, seconds); });
    }
    std::future<bool> pexpire(std::string key, int64_t milliseconds) {
        return submit([=](CacheBackend& b) { return b.pexpire(key, milliseconds); });
    }
    std::future<bool> expireat(std::string key, int64_t unix_seconds) {
        return submit([=](CacheBackend& b) { return b.expireat(key, unix_seconds); });
    }
    std::future<bool> pexpireat(std::string key, int64_t unix_milliseconds) {
        return submit([=](CacheBackend& b) { return b.pexpireat(key, unix_milliseconds); });
    }
    std::future<bool> persist(std::string key) {
        return submit([=](CacheBackend& b) { return b.persist(key); });
    }

    // --- Key space ---
    std::future<std::vector<std::string>> keys(std::string pattern) {
        return submit([=](CacheBackend& b) { return b.keys(pattern); });
    }
    std::future<ScanResult> scan(int64_t cursor, std::optional<std::string> match = std::nullopt,
                                 std::optional<int64_t> count = std::nullopt,
                                 std::optional<KeyType> type = std::nullopt) {
        return submit([=](CacheBackend& b) { return b.scan(cursor, match, count, type); });
    }
    // The whole iteration runs on one worker
    std::future<std::vector<std::string>> iter_keys(std::string pattern,
                                                    std::optional<int64_t> itersize = std::nullopt) {
        return submit([=](CacheBackend& b) {
            std::vector<std::string> out;
            for (const auto& k : b.iter_keys(pattern, itersize)) out.push_back(k);
            return out;
        });
    }
    std::future<int64_t> delete_pattern(std::string pattern, std::optional<int64_t> itersize = std::nullopt) {
        return submit([=](CacheBackend& b) { return b.delete_pattern(pattern, itersize); });
    }
    std::future<void> rename(std::string src, std::string dst) {
        return submit([=](CacheBackend& b) { b.rename(src, dst); });
    }
    std::future<bool> renamenx(std::string src, std::string dst) {
        return submit([=](CacheBackend& b) { return b.renamenx(src, dst); });
    }

    // --- Hashes ---
    std::future<int64_t> hset(std::string key, std::string field, Value value) {
        return submit([=](CacheBackend& b) { return b.hset(key, field, value); });
    }
    std::future<int64_t> hset(std::string key, HashMap mapping) {
        return submit([=](CacheBackend& b) { return b.hset(key, mapping); });
    }
    std::future<bool> hsetnx(std::string key, std::string field, Value value) {
        return submit([=](CacheBackend& b) { return b.hsetnx(key, field, value); });
    }
    std::future<std::optional<Value>> hget(std::string key, std::string field) {
        return submit([=](CacheBackend& b) { return b.hget(key, field); });
    }
    std::future<std::vector<std::optional<Value>>> hmget(std::string key, std::vector<std::string> fields) {
        return submit([=](CacheBackend& b) { return b.hmget(key, fields); });
    }
    std::future<HashMap> hgetall(std::string key) {
        return submit([=](CacheBackend& b) { return b.hgetall(key); });
    }
    std::future<int64_t> hdel(std::string key, std::vector<std::string> fields) {
        return submit([=](CacheBackend& b) { return b.hdel(key, fields); });
    }
    std::future<bool> hexists(std::string key, std::string field) {
        return submit([=](CacheBackend& b) { return b.hexists(key, field); });
    }
    std::future<int64_t> hlen(std::string key) {
        return submit([=](CacheBackend& b) { return b.hlen(key); });
    }
    std::future<std::vector<std::string>> hkeys(std::string key) {
        return submit([=](CacheBackend& b) { return b.hkeys(key); });
    }
    std::future<ValueList> hvals(std::string key) {
        return submit([=](CacheBackend& b) { return b.hvals(key); });
    }
    std::future<int64_t> hincrby(std::string key, std::string field, int64_t amount = 1) {
        return submit([=](CacheBackend& b) { return b.hincrby(key, field, amount); });
    }
    std::future<double> hincrbyfloat(std::string key, std::string field, double amount = 1.0) {
        return submit([=](CacheBackend& b) { return b.hincrbyfloat(key, field, amount); });
    }

    // --- Lists ---
    std::future<int64_t> lpush(std::string key, ValueList values) {
        return submit([=](CacheBackend& b) { return b.lpush(key, values); });
    }
    std::future<int64_t> rpush(std::string key, ValueList values) {
        return submit([=](CacheBackend& b) { return b.rpush(key, values); });
    }
    std::future<std::optional<Value>> lpop(std::string key) {
        return submit([=](CacheBackend& b) { return b.lpop(key); });
    }
    std::future<ValueList> lpop(std::string key, int64_t count) {
        return submit([=](CacheBackend& b) { return b.lpop(key, count); });
    }
    std::future<std::optional<Value>> rpop(std::string key) {
        return submit([=](CacheBackend& b) { return b.rpop(key); });
    }
    std::future<ValueList> rpop(std::string key, int64_t count) {
        return submit([=](CacheBackend& b) { return b.rpop(key, count); });
    }
    std::future<ValueList> lrange(std::string key, int64_t start, int64_t end) {
        return submit([=](CacheBackend& b) { return b.lrange(key, start, end); });
    }
    std::future<std::optional<Value>> lindex(std::string key, int64_t index) {
        return submit([=](CacheBackend& b) { return b.lindex(key, index); });
    }
    std::future<int64_t> llen(std::string key) {
        return submit([=](CacheBackend& b) { return b.llen(key); });
    }
    std::future<std::optional<int64_t>> lpos(std::string key, Value value, LposOptions opts = {}) {
        return submit([=](CacheBackend& b) { return b.lpos(key, value, opts); });
    }
    std::future<std::vector<int64_t>> lpos_count(std::string key, Value value, int64_t count,
                                                 LposOptions opts = {}) {
        return submit([=](CacheBackend& b) { return b.lpos_count(key, value, count, opts); });
    }
    std::future<std::optional<Value>> lmove(std::string src, std::string dst, ListEnd wherefrom, ListEnd whereto) {
        return submit([=](CacheBackend& b) { return b.lmove(src, dst, wherefrom, whereto); });
    }
    std::future<int64_t> lrem(std::string key, int64_t count, Value value) {
        return submit([=](CacheBackend& b) { return b.lrem(key, count, value); });
    }
    std::future<void> ltrim(std::string key, int64_t start, int64_t end) {
        return submit([=](CacheBackend& b) { b.ltrim(key, start, end); });
    }
    std::future<void> lset(std::string key, int64_t index, Value value) {
        return submit([=](CacheBackend& b) { b.lset(key, index, value); });
    }
    std::future<int64_t> linsert(std::string key, InsertWhere where, Value pivot, Value value) {
        return submit([=](CacheBackend& b) { return b.linsert(key, where, pivot, value); });
    }

    // --- Sets ---
    std::future<int64_t> sadd(std::string key, ValueList members) {
        return submit([=](CacheBackend& b) { return b.sadd(key, members); });
    }
    std::future<int64_t> scard(std::string key) {
        return submit([=](CacheBackend& b) { return b.scard(key); });
    }
    std::future<bool> sismember(std::string key, Value member) {
        return submit([=](CacheBackend& b) { return b.sismember(key, member); });
    }
    std::future<std::vector<bool>> smismember(std::string key, ValueList members) {
        return submit([=](CacheBackend& b) { return b.smismember(key, members); });
    }
    std::future<ValueSet> smembers(std::string key) {
        return submit([=](CacheBackend& b) { return b.smembers(key); });
    }
    std::future<std::optional<Value>> srandmember(std::string key) {
        return submit([=](CacheBackend& b) { return b.srandmember(key); });
    }
    std::future<ValueList> srandmember(std::string key, int64_t count) {
        return submit([=](CacheBackend& b) { return b.srandmember(key, count); });
    }
    std::future<std::optional<Value>> spop(std::string key) {
        return submit([=](CacheBackend& b) { return b.spop(key); });
    }
    std::future<ValueList> spop(std::string key, int64_t count) {
        return submit([=](CacheBackend& b) { return b.spop(key, count); });
    }
    std::future<int64_t> srem(std::string key, ValueList members) {
        return submit([=](CacheBackend& b) { return b.srem(key, members); });
    }
    std::future<bool> smove(std::string src, std::string dst, Value member) {
        return submit([=](CacheBackend& b) { return b.smove(src, dst, member); });
    }
    std::future<ValueSet> sdiff(std::vector<std::string> keys) {
        return submit([=](CacheBackend& b) { return b.sdiff(keys); });
    }
    std::future<ValueSet> sinter(std::vector<std::string> keys) {
        return submit([=](CacheBackend& b) { return b.sinter(keys); });
    }
    std::future<ValueSet> sunion(std::vector<std::string> keys) {
        return submit([=](CacheBackend& b) { return b.sunion(keys); });
    }
    std::future<int64_t> sdiffstore(std::string dest, std::vector<std::string> keys) {
        return submit([=](CacheBackend& b) { return b.sdiffstore(dest, keys); });
    }
    std::future<int64_t> sinterstore(std::string dest, std::vector<std::string> keys) {
        return submit([=](CacheBackend& b) { return b.sinterstore(dest, keys); });
    }
    std::future<int64_t> sunionstore(std::string dest, std::vector<std::string> keys) {
        return submit([=](CacheBackend& b) { return b.sunionstore(dest, keys); });
    }

    // --- Sorted sets ---
    std::future<int64_t> zadd(std::string key, std::vector<ScoredMember> members, ZAddFlags flags = {}) {
        return submit([=](CacheBackend& b) { return b.zadd(key, members, flags); });
    }
    std::future<int64_t> zcard(std::string key) {
        return submit([=](CacheBackend& b) { return b.zcard(key); });
    }
    std::future<int64_t> zcount(std::string key, ScoreBound min, ScoreBound max) {
        return submit([=](CacheBackend& b) { return b.zcount(key, min, max); });
    }
    std::future<double> zincrby(std::string key, double amount, Value member) {
        return submit([=](CacheBackend& b) { return b.zincrby(key, amount, member); });
    }
    std::future<std::vector<ScoredMember>> zpopmin(std::string key, int64_t count = 1) {
        return submit([=](CacheBackend& b) { return b.zpopmin(key, count); });
    }
    std::future<std::vector<ScoredMember>> zpopmax(std::string key, int64_t count = 1) {
        return submit([=](CacheBackend& b) { return b.zpopmax(key, count); });
    }
    std::future<ValueList> zrange(std::string key, int64_t start, int64_t end) {
        return submit([=](CacheBackend& b) { return b.zrange(key, start, end); });
    }
    std::future<std::vector<ScoredMember>> zrange_withscores(std::string key, int64_t start, int64_t end) {
        return submit([=](CacheBackend& b) { return b.zrange_withscores(key, start, end); });
    }
    std::future<ValueList> zrevrange(std::string key, int64_t start, int64_t end) {
        return submit([=](CacheBackend& b) { return b.zrevrange(key, start, end); });
    }
    std::future<std::vector<ScoredMember>> zrevrange_withscores(std::string key, int64_t start, int64_t end) {
        return submit([=](CacheBackend& b) { return b.zrevrange_withscores(key, start, end); });
    }
    std::future<ValueList> zrangebyscore(std::string key, ScoreBound min, ScoreBound max,
                                         std::optional<RangeLimit> limit = std::nullopt) {
        return submit([=](CacheBackend& b) { return b.zrangebyscore(key, min, max, limit); });
    }
    std::future<std::vector<ScoredMember>> zrangebyscore_withscores(std::string key, ScoreBound min, ScoreBound max,
                                                                    std::optional<RangeLimit> limit = std::nullopt) {
        return submit([=](CacheBackend& b) { return b.zrangebyscore_withscores(key, min, max, limit); });
    }
    std::future<ValueList> zrevrangebyscore(std::string key, ScoreBound max, ScoreBound min,
                                            std::optional<RangeLimit> limit = std::nullopt) {
        return submit([=](CacheBackend& b) { return b.zrevrangebyscore(key, max, min, limit); });
    }
    std::future<std::vector<ScoredMember>> zrevrangebyscore_withscores(
        std::string key, ScoreBound max, ScoreBound min, std::optional<RangeLimit> limit = std::nullopt) {
        return submit([=](CacheBackend& b) { return b.zrevrangebyscore_withscores(key, max, min, limit); });
    }
    std::future<std::optional<int64_t>> zrank(std::string key, Value member) {
        return submit([=](CacheBackend& b) { return b.zrank(key, member); });
    }
    std::future<std::optional<int64_t>> zrevrank(std::string key, Value member) {
        return submit([=](CacheBackend& b) { return b.zrevrank(key, member); });
    }
    std::future<int64_t> zrem(std::string key, ValueList members) {
        return submit([=](CacheBackend& b) { return b.zrem(key, members); });
    }
    std::future<int64_t> zremrangebyscore(std::string key, ScoreBound min, ScoreBound max) {
        return submit([=](CacheBackend& b) { return b.zremrangebyscore(key, min, max); });
    }
    std::future<int64_t> zremrangebyrank(std::string key, int64_t start, int64_t end) {
        return submit([=](CacheBackend& b) { return b.zremrangebyrank(key, start, end); });
    }
    std::future<std::optional<double>> zscore(std::string key, Value member) {
        return submit([=](CacheBackend& b) { return b.zscore(key, member); });
    }
    std::future<std::vector<std::optional<double>>> zmscore(std::string key, ValueList members) {
        return submit([=](CacheBackend& b) { return b.zmscore(key, members); });
    }

    // --- Native-only surface ---
    std::future<Value> eval(std::string script, std::vector<std::string> keys, std::vector<std::string> args) {
        return submit([=](CacheBackend& b) { return b.eval(script, keys, args); });
    }
    std::future<std::optional<std::pair<std::string, Value>>> blpop(std::vector<std::string> keys, double timeout) {
        return submit([=](CacheBackend& b) { return b.blpop(keys, timeout); });
    }
    std::future<std::optional<std::pair<std::string, Value>>> brpop(std::vector<std::string> keys, double timeout) {
        return submit([=](CacheBackend& b) { return b.brpop(keys, timeout); });
    }
    std::future<std::map<std::string, std::string>> info(std::string section = {}) {
        return submit([=](CacheBackend& b) { return b.info(section); });
    }

private:
    std::shared_ptr<CacheBackend> backend_;
    WorkerPool pool_;
};

} // namespace cachex
