#pragma once
// Abstract cache interface with Redis semantics.
//
// Every backend implements the string, TTL, key-space, hash, list, set and
// sorted-set families. Streams, scripting, blocking pops, locks and server
// introspection throw NotSupportedError unless a backend overrides them.
// Absent keys are reported through sentinels (nullopt, -2, empty), never
// through exceptions.
#include <cstdint>
#include <iterator>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "../types.hpp"
#include "../errors.hpp"

namespace cachex {

class CacheBackend;

// Lazy, finite, restartable sequence of keys built on scan().
// Each begin() restarts from cursor 0.
class KeyRange {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = std::string;
        using difference_type = std::ptrdiff_t;
        using pointer = const std::string*;
        using reference = const std::string&;

        iterator() = default;

        reference operator*() const { return page_[index_]; }
        pointer operator->() const { return &page_[index_]; }
        iterator& operator++();
        iterator operator++(int) { iterator tmp = *this; ++*this; return tmp; }

        bool operator==(const iterator& o) const { return done() && o.done(); }
        bool operator!=(const iterator& o) const { return !(*this == o); }

    private:
        friend class KeyRange;
        iterator(const KeyRange* range) : range_(range) { fetch(0); }

        [[nodiscard]] bool done() const { return range_ == nullptr; }
        void fetch(int64_t cursor);

        const KeyRange* range_ = nullptr;
        std::vector<std::string> page_;
        size_t index_ = 0;
        int64_t next_cursor_ = 0;
    };

    KeyRange(CacheBackend& backend, std::string pattern, int64_t itersize)
        : backend_(&backend), pattern_(std::move(pattern)), itersize_(itersize) {}

    [[nodiscard]] iterator begin() const { return iterator(this); }
    [[nodiscard]] iterator end() const { return iterator(); }

private:
    CacheBackend* backend_;
    std::string pattern_;
    int64_t itersize_;
};

// Stream entry as returned by the native engine
struct StreamEntry {
    std::string id;
    std::map<std::string, std::string> fields;
};

using StreamReadResult = std::map<std::string, std::vector<StreamEntry>>;

// Distributed lock handle returned by CacheBackend::lock()
class CacheLock {
public:
    virtual ~CacheLock() = default;

    // Returns false if the lock is held elsewhere (non-blocking) or the wait timed out
    virtual bool acquire(bool blocking = true, std::optional<double> blocking_timeout = std::nullopt) = 0;
    // Releases only if this handle still owns the lock
    virtual bool release() = 0;
    [[nodiscard]] virtual bool owned() const = 0;
};

class CacheBackend {
public:
    explicit CacheBackend(int64_t scan_itersize = 100) : scan_itersize_(scan_itersize) {}
    virtual ~CacheBackend() = default;

    CacheBackend(const CacheBackend&) = delete;
    CacheBackend& operator=(const CacheBackend&) = delete;

    [[nodiscard]] virtual const char* backend_name() const = 0;
    [[nodiscard]] int64_t scan_itersize() const { return scan_itersize_; }

    // --- Strings and core ---------------------------------------------------

    virtual void set(const std::string& key, const Value& value, Timeout timeout = std::nullopt) = 0;
    virtual std::optional<Value> get(const std::string& key) = 0;
    // Set only if the key is absent (expired keys count as absent)
    virtual bool add(const std::string& key, const Value& value, Timeout timeout = std::nullopt) = 0;
    virtual SetResult set_with_flags(const std::string& key, const Value& value,
                                     Timeout timeout, SetFlags flags) = 0;
    virtual bool del(const std::string& key) = 0;
    virtual bool has_key(const std::string& key) = 0;
    // nullopt timeout removes the expiry
    virtual bool touch(const std::string& key, Timeout timeout) = 0;
    virtual std::map<std::string, Value> get_many(const std::vector<std::string>& keys) = 0;
    virtual void set_many(const std::map<std::string, Value>& data, Timeout timeout = std::nullopt) = 0;
    virtual int64_t delete_many(const std::vector<std::string>& keys) = 0;
    // Throws PreconditionError when the key is missing or not an integer
    virtual int64_t incr(const std::string& key, int64_t delta = 1) = 0;
    int64_t decr(const std::string& key, int64_t delta = 1) {
        if (delta == std::numeric_limits<int64_t>::min()) {
            throw PreconditionError(key, "Decrement of key '" + key + "' would overflow");
        }
        return incr(key, -delta);
    }
    virtual void clear() = 0;
    virtual std::optional<KeyType> type(const std::string& key) = 0;

    // --- TTL ----------------------------------------------------------------
    // ttl/pttl/expiretime: kKeyAbsent if missing, nullopt if persistent

    virtual std::optional<int64_t> ttl(const std::string& key) = 0;
    virtual std::optional<int64_t> pttl(const std::string& key) = 0;
    virtual std::optional<int64_t> expiretime(const std::string& key) = 0;
    virtual bool expire(const std::string& key, double seconds) = 0;
    virtual bool pexpire(const std::string& key, int64_t milliseconds) = 0;
    virtual bool expireat(const std::string& key, int64_t unix_seconds) = 0;
    virtual bool pexpireat(const std::string& key, int64_t unix_milliseconds) = 0;
    virtual bool persist(const std::string& key) = 0;

    // --- Key space ----------------------------------------------------------

    virtual std::vector<std::string> keys(const std::string& pattern) = 0;
    virtual ScanResult scan(int64_t cursor,
                            const std::optional<std::string>& match = std::nullopt,
                            std::optional<int64_t> count = std::nullopt,
                            std::optional<KeyType> type = std::nullopt) = 0;
    [[nodiscard]] KeyRange iter_keys(const std::string& pattern,
                                     std::optional<int64_t> itersize = std::nullopt) {
        return KeyRange(*this, pattern, itersize.value_or(scan_itersize_));
    }
    virtual int64_t delete_pattern(const std::string& pattern,
                                   std::optional<int64_t> itersize = std::nullopt) = 0;
    // Throws PreconditionError when src does not exist
    virtual void rename(const std::string& src, const std::string& dst) = 0;
    virtual bool renamenx(const std::string& src, const std::string& dst) = 0;

    // --- Hashes -------------------------------------------------------------

    // Returns the number of fields that did not exist before
    virtual int64_t hset(const std::string& key, const HashMap& mapping) = 0;
    int64_t hset(const std::string& key, const std::string& field, const Value& value) {
        return hset(key, HashMap{{field, value}});
    }
    virtual bool hsetnx(const std::string& key, const std::string& field, const Value& value) = 0;
    virtual std::optional<Value> hget(const std::string& key, const std::string& field) = 0;
    virtual std::vector<std::optional<Value>> hmget(const std::string& key,
                                                    const std::vector<std::string>& fields) = 0;
    virtual HashMap hgetall(const std::string& key) = 0;
    virtual int64_t hdel(const std::string& key, const std::vector<std::string>& fields) = 0;
    virtual bool hexists(const std::string& key, const std::string& field) = 0;
    virtual int64_t hlen(const std::string& key) = 0;
    virtual std::vector<std::string> hkeys(const std::string& key) = 0;
    virtual ValueList hvals(const std::string& key) = 0;
    virtual int64_t hincrby(const std::string& key, const std::string& field, int64_t amount = 1) = 0;
    virtual double hincrbyfloat(const std::string& key, const std::string& field, double amount = 1.0) = 0;

    // --- Lists --------------------------------------------------------------

    // Values are pushed one at a time, so lpush(k, {a, b}) leaves b at the head
    virtual int64_t lpush(const std::string& key, const ValueList& values) = 0;
    virtual int64_t rpush(const std::string& key, const ValueList& values) = 0;
    virtual std::optional<Value> lpop(const std::string& key) = 0;
    virtual ValueList lpop(const std::string& key, int64_t count) = 0;
    virtual std::optional<Value> rpop(const std::string& key) = 0;
    virtual ValueList rpop(const std::string& key, int64_t count) = 0;
    virtual ValueList lrange(const std::string& key, int64_t start, int64_t end) = 0;
    virtual std::optional<Value> lindex(const std::string& key, int64_t index) = 0;
    virtual int64_t llen(const std::string& key) = 0;
    virtual std::optional<int64_t> lpos(const std::string& key, const Value& value,
                                        const LposOptions& opts = {}) = 0;
    // count 0 returns every match
    virtual std::vector<int64_t> lpos_count(const std::string& key, const Value& value,
                                            int64_t count, const LposOptions& opts = {}) = 0;
    virtual std::optional<Value> lmove(const std::string& src, const std::string& dst,
                                       ListEnd wherefrom, ListEnd whereto) = 0;
    // count > 0 from the head, < 0 from the tail, 0 removes all
    virtual int64_t lrem(const std::string& key, int64_t count, const Value& value) = 0;
    virtual void ltrim(const std::string& key, int64_t start, int64_t end) = 0;
    // Throws IndexOutOfRangeError
    virtual void lset(const std::string& key, int64_t index, const Value& value) = 0;
    // New length, 0 if the key is missing, -1 if the pivot is not found
    virtual int64_t linsert(const std::string& key, InsertWhere where,
                            const Value& pivot, const Value& value) = 0;

    // --- Sets ---------------------------------------------------------------

    virtual int64_t sadd(const std::string& key, const ValueList& members) = 0;
    virtual int64_t scard(const std::string& key) = 0;
    virtual bool sismember(const std::string& key, const Value& member) = 0;
    virtual std::vector<bool> smismember(const std::string& key, const ValueList& members) = 0;
    virtual ValueSet smembers(const std::string& key) = 0;
    virtual std::optional<Value> srandmember(const std::string& key) = 0;
    // count >= 0 samples without replacement, count < 0 draws |count| with replacement
    virtual ValueList srandmember(const std::string& key, int64_t count) = 0;
    virtual std::optional<Value> spop(const std::string& key) = 0;
    virtual ValueList spop(const std::string& key, int64_t count) = 0;
    virtual int64_t srem(const std::string& key, const ValueList& members) = 0;
    virtual bool smove(const std::string& src, const std::string& dst, const Value& member) = 0;
    virtual ValueSet sdiff(const std::vector<std::string>& keys) = 0;
    virtual ValueSet sinter(const std::vector<std::string>& keys) = 0;
    virtual ValueSet sunion(const std::vector<std::string>& keys) = 0;
    virtual int64_t sdiffstore(const std::string& dest, const std::vector<std::string>& keys) = 0;
    virtual int64_t sinterstore(const std::string& dest, const std::vector<std::string>& keys) = 0;
    virtual int64_t sunionstore(const std::string& dest, const std::vector<std::string>& keys) = 0;

    // --- Sorted sets --------------------------------------------------------

    virtual int64_t zadd(const std::string& key, const std::vector<ScoredMember>& members,
                         ZAddFlags flags = {}) = 0;
    virtual int64_t zcard(const std::string& key) = 0;
    virtual int64_t zcount(const std::string& key, const ScoreBound& min, const ScoreBound& max) = 0;
    virtual double zincrby(const std::string& key, double amount, const Value& member) = 0;
    virtual std::vector<ScoredMember> zpopmin(const std::string& key, int64_t count = 1) = 0;
    virtual std::vector<ScoredMember> zpopmax(const std::string& key, int64_t count = 1) = 0;
    virtual std::vector<ScoredMember> zrange_withscores(const std::string& key,
                                                        int64_t start, int64_t end) = 0;
    virtual std::vector<ScoredMember> zrevrange_withscores(const std::string& key,
                                                           int64_t start, int64_t end) = 0;
    virtual std::vector<ScoredMember> zrangebyscore_withscores(
        const std::string& key, const ScoreBound& min, const ScoreBound& max,
        std::optional<RangeLimit> limit = std::nullopt) = 0;
    virtual std::vector<ScoredMember> zrevrangebyscore_withscores(
        const std::string& key, const ScoreBound& max, const ScoreBound& min,
        std::optional<RangeLimit> limit = std::nullopt) = 0;
    ValueList zrange(const std::string& key, int64_t start, int64_t end) {
        return members_of(zrange_withscores(key, start, end));
    }
    ValueList zrevrange(const std::string& key, int64_t start, int64_t end) {
        return members_of(zrevrange_withscores(key, start, end));
    }
    ValueList zrangebyscore(const std::string& key, const ScoreBound& min, const ScoreBound& max,
                            std::optional<RangeLimit> limit = std::nullopt) {
        return members_of(zrangebyscore_withscores(key, min, max, limit));
    }
    ValueList zrevrangebyscore(const std::string& key, const ScoreBound& max, const ScoreBound& min,
                               std::optional<RangeLimit> limit = std::nullopt) {
        return members_of(zrevrangebyscore_withscores(key, max, min, limit));
    }
    virtual std::optional<int64_t> zrank(const std::string& key, const Value& member) = 0;
    virtual std::optional<int64_t> zrevrank(const std::string& key, const Value& member) = 0;
    virtual int64_t zrem(const std::string& key, const ValueList& members) = 0;
    virtual int64_t zremrangebyscore(const std::string& key, const ScoreBound& min, const ScoreBound& max) = 0;
    virtual int64_t zremrangebyrank(const std::string& key, int64_t start, int64_t end) = 0;
    virtual std::optional<double> zscore(const std::string& key, const Value& member) = 0;
    virtual std::vector<std::optional<double>> zmscore(const std::string& key, const ValueList& members) = 0;

    // --- Native-only surface ------------------------------------------------

    virtual std::string xadd(const std::string& key, const std::map<std::string, std::string>& fields,
                             const std::string& id = "*");
    virtual int64_t xlen(const std::string& key);
    virtual std::vector<StreamEntry> xrange(const std::string& key, const std::string& start = "-",
                                            const std::string& end = "+",
                                            std::optional<int64_t> count = std::nullopt);
    virtual std::vector<StreamEntry> xrevrange(const std::string& key, const std::string& end = "+",
                                               const std::string& start = "-",
                                               std::optional<int64_t> count = std::nullopt);
    virtual StreamReadResult xread(const std::map<std::string, std::string>& streams,
                                   std::optional<int64_t> count = std::nullopt,
                                   std::optional<int64_t> block_ms = std::nullopt);
    virtual int64_t xtrim(const std::string& key, int64_t maxlen);
    virtual int64_t xdel(const std::string& key, const std::vector<std::string>& ids);
    virtual bool xgroup_create(const std::string& key, const std::string& group,
                               const std::string& id = "$", bool mkstream = false);
    virtual int64_t xgroup_destroy(const std::string& key, const std::string& group);
    virtual StreamReadResult xreadgroup(const std::string& group, const std::string& consumer,
                                        const std::map<std::string, std::string>& streams,
                                        std::optional<int64_t> count = std::nullopt);
    virtual int64_t xack(const std::string& key, const std::string& group,
                         const std::vector<std::string>& ids);
    virtual Value eval(const std::string& script, const std::vector<std::string>& keys,
                       const std::vector<std::string>& args);
    virtual std::optional<std::pair<std::string, Value>> blpop(const std::vector<std::string>& keys,
                                                               double timeout);
    virtual std::optional<std::pair<std::string, Value>> brpop(const std::vector<std::string>& keys,
                                                               double timeout);
    virtual std::optional<Value> blmove(const std::string& src, const std::string& dst,
                                        ListEnd wherefrom, ListEnd whereto, double timeout);
    virtual std::pair<int64_t, ValueSet> sscan(const std::string& key, int64_t cursor,
                                               const std::optional<std::string>& match = std::nullopt,
                                               std::optional<int64_t> count = std::nullopt);
    // timeout: lock auto-expires after this many seconds
    virtual std::unique_ptr<CacheLock> lock(const std::string& name, std::optional<double> timeout = std::nullopt);
    virtual std::map<std::string, std::string> info(const std::string& section = {});
    virtual std::vector<Value> slowlog_get(int64_t count = 10);
    virtual int64_t slowlog_len();

protected:
    [[noreturn]] void not_supported(const char* operation) const;

    static ValueList members_of(const std::vector<ScoredMember>& scored) {
        ValueList out;
        out.reserve(scored.size());
        for (const auto& sm : scored) out.push_back(sm.member);
        return out;
    }

    int64_t scan_itersize_;
};

} // namespace cachex
