#pragma once
// Native engine strategy over hiredis.
//
// Every operation is one command (or one server-side script) on a single
// connection guarded by a mutex. Values go through the same ValueCodec as
// the relational backend, so integers stay INCR-able decimal text.
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "../cache_backend.hpp"
#include "../../codec/value_codec.hpp"
#include "../../config.hpp"

struct redisContext;
struct redisReply;

namespace cachex {

class RedisBackend : public CacheBackend {
public:
    // Connects eagerly; throws DatabaseError when the server is unreachable
    RedisBackend(const RedisConfig& redis, const CodecConfig& codec, int64_t scan_itersize = 100);
    explicit RedisBackend(const CacheConfig& cfg) : RedisBackend(cfg.redis, cfg.codec, cfg.scan_itersize) {}
    ~RedisBackend() override;

    [[nodiscard]] const char* backend_name() const override { return "redis"; }

    // --- Strings and core ---
    void set(const std::string& key, const Value& value, Timeout timeout = std::nullopt) override;
    std::optional<Value> get(const std::string& key) override;
    bool add(const std::string& key, const Value& value, Timeout timeout = std::nullopt) override;
    SetResult set_with_flags(const std::string& key, const Value& value,
                             Timeout timeout, SetFlags flags) override;
    bool del(const std::string& key) override;
    bool has_key(const std::string& key) override;
    bool touch(const std::string& key, Timeout timeout) override;
    std::map<std::string, Value> get_many(const std::vector<std::string>& keys) override;
    void set_many(const std::map<std::string, Value>& data, Timeout timeout = std::nullopt) override;
    int64_t delete_many(const std::vector<std::string>& keys) override;
    int64_t incr(const std::string& key, int64_t delta = 1) override;
    void clear() override;
    std::optional<KeyType> type(const std::string& key) override;

    // --- TTL ---
    std::optional<int64_t> ttl(const std::string& key) override;
    std::optional<int64_t> pttl(const std::string& key) override;
    std::optional<int64_t> expiretime(const std::string& key) override;
    bool expire(const std::string& key, double seconds) override;
    bool pexpire(const std::string& key, int64_t milliseconds) override;
    bool expireat(const std::string& key, int64_t unix_seconds) override;
    bool pexpireat(const std::string& key, int64_t unix_milliseconds) override;
    bool persist(const std::string& key) override;

    // --- Key space ---
    std::vector<std::string> keys(const std::string& pattern) override;
    ScanResult scan(int64_t cursor,
                    const std::optional<std::string>& match = std::nullopt,
                    std::optional<int64_t> count = std::nullopt,
                    std::optional<KeyType> type = std::nullopt) override;
    int64_t delete_pattern(const std::string& pattern, std::optional<int64_t> itersize = std::nullopt) override;
    void rename(const std::string& src, const std::string& dst) override;
    bool renamenx(const std::string& src, const std::string& dst) override;

    // --- Hashes ---
    using CacheBackend::hset;
    int64_t hset(const std::string& key, const HashMap& mapping) override;
    bool hsetnx(const std::string& key, const std::string& field, const Value& value) override;
    std::optional<Value> hget(const std::string& key, const std::string& field) override;
    std::vector<std::optional<Value>> hmget(const std::string& key,
                                            const std::vector<std::string>& fields) override;
    HashMap hgetall(const std::string& key) override;
    int64_t hdel(const std::string& key, const std::vector<std::string>& fields) override;
    bool hexists(const std::string& key, const std::string& field) override;
    int64_t hlen(const std::string& key) override;
    std::vector<std::string> hkeys(const std::string& key) override;
    ValueList hvals(const std::string& key) override;
    int64_t hincrby(const std::string& key, const std::string& field, int64_t amount = 1) override;
    double hincrbyfloat(const std::string& key, const std::string& field, double amount = 1.0) override;

    // --- Lists ---
    int64_t lpush(const std::string& key, const ValueList& values) override;
    int64_t rpush(const std::string& key, const ValueList& values) override;
    std::optional<Value> lpop(const std::string& key) override;
    ValueList lpop(const std::string& key, int64_t count) override;
    std::optional<Value> rpop(const std::string& key) override;
    ValueList rpop(const std::string& key, int64_t count) override;
    ValueList lrange(const std::string& key, int64_t start, int64_t end) override;
    std::optional<Value> lindex(const std::string& key, int64_t index) override;
    int64_t llen(const std::string& key) override;
    std::optional<int64_t> lpos(const std::string& key, const Value& value,
                                const LposOptions& opts = {}) override;
    std::vector<int64_t> lpos_count(const std::string& key, const Value& value,
                                    int64_t count, const LposOptions& opts = {}) override;
    std::optional<Value> lmove(const std::string& src, const std::string& dst,
                               ListEnd wherefrom, ListEnd whereto) override;
    int64_t lrem(const std::string& key, int64_t count, const Value& value) override;
    void ltrim(const std::string& key, int64_t start, int64_t end) override;
    void lset(const std::string& key, int64_t index, const Value& value) override;
    int64_t linsert(const std::string& key, InsertWhere where,
                    const Value& pivot, const Value& value) override;

    // --- Sets ---
    int64_t sadd(const std::string& key, const ValueList& members) override;
    int64_t scard(const std::string& key) override;
    bool sismember(const std::string& key, const Value& member) override;
    std::vector<bool> smismember(const std::string& key, const ValueList& members) override;
    ValueSet smembers(const std::string& key) override;
    std::optional<Value> srandmember(const std::string& key) override;
    ValueList srandmember(const std::string& key, int64_t count) override;
    std::optional<Value> spop(const std::string& key) override;
    ValueList spop(const std::string& key, int64_t count) override;
    int64_t srem(const std::string& key, const ValueList& members) override;
    bool smove(const std::string& src, const std::string& dst, const Value& member) override;
    ValueSet sdiff(const std::vector<std::string>& keys) override;
    ValueSet sinter(const std::vector<std::string>& keys) override;
    ValueSet sunion(const std::vector<std::string>& keys) override;
    int64_t sdiffstore(const std::string& dest, const std::vector<std::string>& keys) override;
    int64_t sinterstore(const std::string& dest, const std::vector<std::string>& keys) override;
    int64_t sunionstore(const std::string& dest, const std::vector<std::string>& keys) override;

    // --- Sorted sets ---
    int64_t zadd(const std::string& key, const std::vector<ScoredMember>& members,
                 ZAddFlags flags = {}) override;
    int64_t zcard(const std::string& key) override;
    int64_t zcount(const std::string& key, const ScoreBound& min, const ScoreBound& max) override;
    double zincrby(const std::string& key, double amount, const Value& member) override;
    std::vector<ScoredMember> zpopmin(const std::string& key, int64_t count = 1) override;
    std::vector<ScoredMember> zpopmax(const std::string& key, int64_t count = 1) override;
    std::vector<ScoredMember> zrange_withscores(const std::string& key, int64_t start, int64_t end) override;
    std::vector<ScoredMember> zrevrange_withscores(const std::string& key, int64_t start, int64_t end) override;
    std::vector<ScoredMember> zrangebyscore_withscores(
        const std::string& key, const ScoreBound& min, const ScoreBound& max,
        std::optional<RangeLimit> limit = std::nullopt) override;
    std::vector<ScoredMember> zrevrangebyscore_withscores(
        const std::string& key, const ScoreBound& max, const ScoreBound& min,
        std::optional<RangeLimit> limit = std::nullopt) override;
    std::optional<int64_t> zrank(const std::string& key, const Value& member) override;
    std::optional<int64_t> zrevrank(const std::string& key, const Value& member) override;
    int64_t zrem(const std::string& key, const ValueList& members) override;
    int64_t zremrangebyscore(const std::string& key, const ScoreBound& min, const ScoreBound& max) override;
    int64_t zremrangebyrank(const std::string& key, int64_t start, int64_t end) override;
    std::optional<double> zscore(const std::string& key, const Value& member) override;
    std::vector<std::optional<double>> zmscore(const std::string& key, const ValueList& members) override;

    // --- Native-only surface ---
    std::string xadd(const std::string& key, const std::map<std::string, std::string>& fields,
                     const std::string& id = "*") override;
    int64_t xlen(const std::string& key) override;
    int64_t xtrim(const std::string& key, int64_t maxlen) override;
    int64_t xdel(const std::string& key, const std::vector<std::string>& ids) override;
    // Script replies come back raw: integers, strings, arrays and nil
    Value eval(const std::string& script, const std::vector<std::string>& keys,
               const std::vector<std::string>& args) override;
    std::optional<std::pair<std::string, Value>> blpop(const std::vector<std::string>& keys,
                                                       double timeout) override;
    std::optional<std::pair<std::string, Value>> brpop(const std::vector<std::string>& keys,
                                                       double timeout) override;
    std::optional<Value> blmove(const std::string& src, const std::string& dst,
                                ListEnd wherefrom, ListEnd whereto, double timeout) override;
    std::unique_ptr<CacheLock> lock(const std::string& name, std::optional<double> timeout = std::nullopt) override;
    std::map<std::string, std::string> info(const std::string& section = {}) override;
    int64_t slowlog_len() override;

private:
    friend class RedisLock;

    struct ReplyDeleter {
        void operator()(redisReply* r) const;
    };
    using Reply = std::unique_ptr<redisReply, ReplyDeleter>;

    // (Re)opens ctx_, authenticates and selects the database; caller holds mu_
    void connect();
    // One round trip on ctx_; caller holds mu_
    Reply send(const std::vector<std::string>& args);
    // Reply as sent by the server, error replies included
    Reply call(const std::vector<std::string>& args);
    // Error replies become DatabaseError
    Reply command(const std::vector<std::string>& args);

    int64_t command_int(const std::vector<std::string>& args);
    std::optional<Value> command_value(const std::vector<std::string>& args);
    ValueList command_values(const std::vector<std::string>& args);
    ValueSet command_set(const std::vector<std::string>& args);
    std::vector<ScoredMember> command_scored(const std::vector<std::string>& args);
    std::optional<std::pair<std::string, Value>> blocking_pop(const char* cmd, const std::vector<std::string>& keys,
                                                              double timeout);

    RedisConfig cfg_;
    ValueCodec codec_;
    redisContext* ctx_ = nullptr;
    std::mutex mu_;
};

} // namespace cachex
