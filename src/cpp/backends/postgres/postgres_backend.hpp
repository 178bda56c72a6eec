#pragma once
// PostgreSQL emulation of a multi-type key-value store.
//
// Each public operation borrows one pooled connection and runs as a single
// transaction. Reads filter expired rows; writes purge them. Reads that feed
// a conditional write lock the row with SELECT ... FOR UPDATE.
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>
#include "../cache_backend.hpp"
#include "../../codec/value_codec.hpp"
#include "../../config.hpp"
#include "../../utils/logger.hpp"
#include "pg_connection.hpp"
#include "schema.hpp"

namespace cachex {

struct StorageStats {
    std::map<KeyType, int64_t> live_keys;   // Per type, expired rows excluded
    int64_t expired_keys = 0;               // Waiting for purge_expired()
    int64_t total_bytes = 0;                // All five relations incl. indexes
};

class PostgresBackend : public CacheBackend {
public:
    PostgresBackend(const PostgresConfig& pg, const CodecConfig& codec, int64_t scan_itersize = 100);
    explicit PostgresBackend(const CacheConfig& cfg)
        : PostgresBackend(cfg.postgresql, cfg.codec, cfg.scan_itersize) {}

    [[nodiscard]] const char* backend_name() const override { return "postgresql"; }

    // --- Schema and maintenance ---
    void create_schema();
    void drop_schema();
    // Deletes every expired key with its auxiliary rows; returns the key count
    int64_t purge_expired();
    StorageStats storage_stats();

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

private:
    // One pooled connection and one transaction around fn(conn)
    template <typename Fn>
    auto run(const char* op, Fn&& fn) -> decltype(fn(std::declval<PgConnection&>()));

    [[nodiscard]] std::string sql(std::string_view tmpl) const { return tables_.render(tmpl); }

    // Registry helpers; all expect to run inside run()
    void ensure_key(PgConnection& c, const std::string& key, KeyType type);
    void delete_aux(PgConnection& c, const std::string& key, KeyType type);
    void delete_all_aux(PgConnection& c, const std::string& key);
    bool delete_key(PgConnection& c, const std::string& key);
    void purge_if_expired(PgConnection& c, const std::string& key);
    bool is_live(PgConnection& c, const std::string& key, std::optional<KeyType> type = std::nullopt);
    // Drops the registry row once its last element is gone
    void drop_if_empty(PgConnection& c, const std::string& key, KeyType type);
    void upsert_string(PgConnection& c, const std::string& key, const std::string& bytes, Timeout timeout);
    // kKeyAbsent, nullopt for persistent keys, else the value of expr
    std::optional<int64_t> ttl_query(const char* op, const std::string& key, const char* expr);
    bool set_expiry(const char* op, const std::string& key, const std::string& expr, PgParams params);

    // Lists
    std::vector<int64_t> list_positions(PgConnection& c, const std::string& key);
    int64_t list_len(PgConnection& c, const std::string& key);
    // One element past the current head or tail
    void list_append(PgConnection& c, const std::string& key, const std::string& bytes, ListEnd end);
    // Removes and returns up to count encoded elements from one end
    std::vector<std::string> list_take(PgConnection& c, const std::string& key, int64_t count, ListEnd end);
    int64_t list_push(const char* op, const std::string& key, const ValueList& values, ListEnd end);
    ValueList list_pop(const char* op, const std::string& key, int64_t count, ListEnd end);

    // Sets
    std::vector<std::string> set_members_raw(PgConnection& c, const std::string& key);
    enum class SetOp { DIFF, INTER, UNION };
    std::vector<std::string> set_algebra(PgConnection& c, const std::vector<std::string>& keys, SetOp op);
    int64_t set_store(const char* op, const std::string& dest, const std::vector<std::string>& keys, SetOp sop);
    ValueList set_sample(const char* op, const std::string& key, std::optional<int64_t> count, bool remove);

    // Sorted sets
    std::vector<ScoredMember> zset_rows(PgResult& res);
    std::vector<ScoredMember> zset_pop(const char* op, const std::string& key, int64_t count, bool max);
    std::vector<ScoredMember> zset_range_by_rank(const char* op, const std::string& key,
                                                 int64_t start, int64_t end, bool reverse);
    std::vector<ScoredMember> zset_range_by_score(const char* op, const std::string& key,
                                                  const ScoreBound& min, const ScoreBound& max,
                                                  std::optional<RangeLimit> limit, bool reverse);
    std::optional<int64_t> zset_rank(const char* op, const std::string& key, const Value& member, bool reverse);

    // Appended to auxiliary-table queries whose key is bound to $1
    static constexpr const char* kLiveKey =
        " AND EXISTS (SELECT 1 FROM {main} m WHERE m.key = $1"
        " AND (m.expires_at IS NULL OR m.expires_at > NOW()))";

    // "$n, $n+1, ..." with each value pushed into params
    static std::string bind_list(PgParams& params, const std::vector<std::string>& values, bool as_bytes);
    static std::string type_id(KeyType t) { return std::to_string(static_cast<int>(t)); }
    // "NULL" or "NOW() + make_interval(secs => $n)"
    static std::string expiry_expr(PgParams& params, Timeout timeout);

    TableSet tables_;
    ValueCodec codec_;
    bool unlogged_;
    PgPool pool_;
    std::mt19937_64 rng_;
    std::mutex rng_mu_;
};

template <typename Fn>
auto PostgresBackend::run(const char* op, Fn&& fn) -> decltype(fn(std::declval<PgConnection&>())) {
    using R = decltype(fn(std::declval<PgConnection&>()));
    auto conn = pool_.acquire();
    try {
        Transaction tx(*conn);
        if constexpr (std::is_void_v<R>) {
            fn(*conn);
            tx.commit();
        } else {
            R result = fn(*conn);
            tx.commit();
            return result;
        }
    } catch (const CacheError& e) {
        LOG_ERR("[postgresql] %s failed: %s", op, e.what());
        throw;
    }
}

} // namespace cachex
