#include "redis_backend.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <random>
#include <thread>
#include <hiredis/hiredis.h>
#include "../../utils/logger.hpp"
#include "../../utils/timer.hpp"

namespace cachex {

namespace {

// SET with NX/XX that also reports the previous string value
const char* kSetGetScript =
    "local old = false\n"
    "if redis.call('TYPE', KEYS[1])['ok'] == 'string' then old = redis.call('GET', KEYS[1]) end\n"
    "local args = {KEYS[1], ARGV[1]}\n"
    "if ARGV[2] ~= '' then table.insert(args, ARGV[2]) end\n"
    "if ARGV[3] ~= '' then table.insert(args, 'PX') table.insert(args, ARGV[3]) end\n"
    "if redis.call('SET', unpack(args)) then return {1, old} end\n"
    "return {0, old}\n";

// INCRBY that refuses to create the key
const char* kIncrScript =
    "if redis.call('EXISTS', KEYS[1]) == 0 then return redis.error_reply('no such key') end\n"
    "return redis.call('INCRBY', KEYS[1], ARGV[1])\n";

const char* kUnlockScript =
    "if redis.call('GET', KEYS[1]) == ARGV[1] then return redis.call('DEL', KEYS[1]) end\n"
    "return 0\n";

std::string reply_str(const redisReply* r) {
    if (r->type == REDIS_REPLY_INTEGER) return std::to_string(r->integer);
    if (!r->str) return {};
    return std::string(r->str, r->len);
}

bool contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

std::string score_arg(double v) {
    if (std::isinf(v)) return v > 0 ? "+inf" : "-inf";
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.17g", v);
    return buf;
}

std::string bound_arg(const ScoreBound& b) {
    return (b.inclusive ? "" : "(") + score_arg(b.value);
}

std::string ms_arg(double seconds) {
    return std::to_string(std::llround(seconds * 1000.0));
}

double parse_score(const redisReply* r) {
    return std::strtod(reply_str(r).c_str(), nullptr);
}

Value reply_to_value(const redisReply* r) {
    switch (r->type) {
        case REDIS_REPLY_INTEGER: return Value(static_cast<int64_t>(r->integer));
        case REDIS_REPLY_NIL:     return Value(nullptr);
        case REDIS_REPLY_ARRAY: {
            Value arr = Value::array();
            for (size_t i = 0; i < r->elements; i++) arr.push_back(reply_to_value(r->element[i]));
            return arr;
        }
        default: return Value(reply_str(r));
    }
}

void append_values(std::vector<std::string>& args, const ValueCodec& codec, const ValueList& values) {
    for (const auto& v : values) args.push_back(codec.encode(v));
}

} // namespace

// --- Lock -------------------------------------------------------------------

// SET NX PX with a random token; release only deletes a key still holding it
class RedisLock : public CacheLock {
public:
    RedisLock(RedisBackend& backend, std::string name, std::optional<double> timeout)
        : backend_(&backend), name_(std::move(name)), timeout_(timeout) {
        std::random_device rd;
        char buf[33];
        std::snprintf(buf, sizeof(buf), "%08x%08x%08x%08x", rd(), rd(), rd(), rd());
        token_ = buf;
    }

    bool acquire(bool blocking, std::optional<double> blocking_timeout) override {
        std::vector<std::string> args{"SET", name_, token_, "NX"};
        if (timeout_) args.insert(args.end(), {"PX", ms_arg(*timeout_)});

        auto deadline = std::chrono::steady_clock::now();
        if (blocking_timeout) {
            deadline += std::chrono::milliseconds(std::llround(*blocking_timeout * 1000.0));
        }
        for (;;) {
            auto reply = backend_->command(args);
            if (reply->type != REDIS_REPLY_NIL) {
                LOG_DBG("[redis] Lock '%s' acquired", name_.c_str());
                return true;
            }
            if (!blocking) return false;
            if (blocking_timeout && std::chrono::steady_clock::now() >= deadline) {
                LOG_DBG("[redis] Lock '%s' wait timed out", name_.c_str());
                return false;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }

    bool release() override {
        return backend_->command_int({"EVAL", kUnlockScript, "1", name_, token_}) == 1;
    }

    [[nodiscard]] bool owned() const override {
        auto reply = backend_->command({"GET", name_});
        return reply->type == REDIS_REPLY_STRING && reply_str(reply.get()) == token_;
    }

private:
    RedisBackend* backend_;
    std::string name_;
    std::optional<double> timeout_;
    std::string token_;
};

// --- Connection -------------------------------------------------------------

void RedisBackend::ReplyDeleter::operator()(redisReply* r) const {
    if (r) freeReplyObject(r);
}

RedisBackend::RedisBackend(const RedisConfig& redis, const CodecConfig& codec, int64_t scan_itersize)
    : CacheBackend(scan_itersize), cfg_(redis), codec_(codec) {
    std::lock_guard<std::mutex> lock(mu_);
    connect();
}

RedisBackend::~RedisBackend() {
    if (ctx_) redisFree(ctx_);
}

void RedisBackend::connect() {
    if (ctx_) {
        redisFree(ctx_);
        ctx_ = nullptr;
    }

    struct timeval timeout = {cfg_.connect_timeout, 0};
    redisContext* c = redisConnectWithTimeout(cfg_.host.c_str(), cfg_.port, timeout);
    if (!c || c->err) {
        std::string msg = c ? c->errstr : "cannot allocate redis context";
        LOG_ERR("[redis] Connection to %s:%u failed: %s", cfg_.host.c_str(), cfg_.port, msg.c_str());
        if (c) redisFree(c);
        throw DatabaseError("redis connection failed: " + msg);
    }
    ctx_ = c;

    try {
        // Redis 6+ ACL user, or the legacy requirepass
        if (!cfg_.password.empty()) {
            std::vector<std::string> auth{"AUTH"};
            if (!cfg_.user.empty()) auth.push_back(cfg_.user);
            auth.push_back(cfg_.password);
            auto reply = send(auth);
            if (reply->type == REDIS_REPLY_ERROR) throw DatabaseError("redis AUTH failed: " + reply_str(reply.get()));
            if (!cfg_.user.empty()) LOG_INF("[redis] Authenticated as user '%s'", cfg_.user.c_str());
        }
        if (cfg_.db != 0) {
            auto reply = send({"SELECT", std::to_string(cfg_.db)});
            if (reply->type == REDIS_REPLY_ERROR) throw DatabaseError("redis SELECT failed: " + reply_str(reply.get()));
        }
        auto reply = send({"PING"});
        if (reply->type == REDIS_REPLY_ERROR) throw DatabaseError("redis PING failed: " + reply_str(reply.get()));
    } catch (const DatabaseError& e) {
        LOG_ERR("[redis] %s", e.what());
        redisFree(ctx_);
        ctx_ = nullptr;
        throw;
    }

    LOG_INF("[redis] Connected to %s:%u db %d", cfg_.host.c_str(), cfg_.port, cfg_.db);
}

RedisBackend::Reply RedisBackend::send(const std::vector<std::string>& args) {
    std::vector<const char*> argv;
    std::vector<size_t> argvlen;
    argv.reserve(args.size());
    argvlen.reserve(args.size());
    for (const auto& a : args) {
        argv.push_back(a.data());
        argvlen.push_back(a.size());
    }

    Timer timer;
    auto* raw = static_cast<redisReply*>(
        redisCommandArgv(ctx_, static_cast<int>(argv.size()), argv.data(), argvlen.data()));
    if (!raw) {
        std::string msg = ctx_->errstr;
        LOG_ERR("[redis] %s: I/O error: %s", args.front().c_str(), msg.c_str());
        throw DatabaseError("redis I/O error: " + msg);
    }
    LOG_DBG("[redis] %.3f ms: %s (%zu args)", timer.elapsed_ms(), args.front().c_str(), args.size() - 1);
    return Reply(raw);
}

RedisBackend::Reply RedisBackend::call(const std::vector<std::string>& args) {
    // Blocking pops keep the connection for their whole wait
    std::lock_guard<std::mutex> lock(mu_);
    if (!ctx_ || ctx_->err) {
        LOG_WRN("[redis] Connection lost, reconnecting");
        connect();
    }
    return send(args);
}

RedisBackend::Reply RedisBackend::command(const std::vector<std::string>& args) {
    auto reply = call(args);
    if (reply->type == REDIS_REPLY_ERROR) {
        std::string msg = reply_str(reply.get());
        LOG_ERR("[redis] %s failed: %s", args.front().c_str(), msg.c_str());
        throw DatabaseError(msg);
    }
    return reply;
}

int64_t RedisBackend::command_int(const std::vector<std::string>& args) {
    auto reply = command(args);
    if (reply->type != REDIS_REPLY_INTEGER) {
        throw DatabaseError("unexpected reply type " + std::to_string(reply->type) + " to " + args.front());
    }
    return reply->integer;
}

std::optional<Value> RedisBackend::command_value(const std::vector<std::string>& args) {
    auto reply = command(args);
    if (reply->type == REDIS_REPLY_NIL) return std::nullopt;
    return codec_.decode(reply_str(reply.get()));
}

ValueList RedisBackend::command_values(const std::vector<std::string>& args) {
    auto reply = command(args);
    ValueList out;
    if (reply->type != REDIS_REPLY_ARRAY) return out;
    out.reserve(reply->elements);
    for (size_t i = 0; i < reply->elements; i++) {
        if (reply->element[i]->type == REDIS_REPLY_NIL) continue;
        out.push_back(codec_.decode(reply_str(reply->element[i])));
    }
    return out;
}

ValueSet RedisBackend::command_set(const std::vector<std::string>& args) {
    auto values = command_values(args);
    return ValueSet(values.begin(), values.end());
}

std::vector<ScoredMember> RedisBackend::command_scored(const std::vector<std::string>& args) {
    auto reply = command(args);
    std::vector<ScoredMember> out;
    if (reply->type != REDIS_REPLY_ARRAY) return out;
    for (size_t i = 0; i + 1 < reply->elements; i += 2) {
        out.push_back({codec_.decode(reply_str(reply->element[i])), parse_score(reply->element[i + 1])});
    }
    return out;
}

// --- Strings and core -------------------------------------------------------

void RedisBackend::set(const std::string& key, const Value& value, Timeout timeout) {
    if (timeout && std::llround(*timeout * 1000.0) <= 0) {
        del(key);
        return;
    }
    std::vector<std::string> args{"SET", key, codec_.encode(value)};
    if (timeout) args.insert(args.end(), {"PX", ms_arg(*timeout)});
    command(args);
}

std::optional<Value> RedisBackend::get(const std::string& key) {
    auto reply = call({"GET", key});
    // WRONGTYPE reads as a miss, as on the relational backend
    if (reply->type != REDIS_REPLY_STRING) return std::nullopt;
    return codec_.decode(reply_str(reply.get()));
}

bool RedisBackend::add(const std::string& key, const Value& value, Timeout timeout) {
    if (timeout && std::llround(*timeout * 1000.0) <= 0) return !has_key(key);
    std::vector<std::string> args{"SET", key, codec_.encode(value), "NX"};
    if (timeout) args.insert(args.end(), {"PX", ms_arg(*timeout)});
    return command(args)->type != REDIS_REPLY_NIL;
}

SetResult RedisBackend::set_with_flags(const std::string& key, const Value& value,
                                       Timeout timeout, SetFlags flags) {
    if (timeout && *timeout == 0) return {};

    std::string mode = flags.nx ? "NX" : flags.xx ? "XX" : "";
    SetResult result;
    if (!flags.get) {
        std::vector<std::string> args{"SET", key, codec_.encode(value)};
        if (!mode.empty()) args.push_back(mode);
        if (timeout) args.insert(args.end(), {"PX", ms_arg(*timeout)});
        result.applied = command(args)->type != REDIS_REPLY_NIL;
        return result;
    }

    auto reply = command({"EVAL", kSetGetScript, "1", key, codec_.encode(value), mode,
                          timeout ? ms_arg(*timeout) : std::string()});
    if (reply->type != REDIS_REPLY_ARRAY || reply->elements != 2) {
        throw DatabaseError("unexpected reply to SET GET script");
    }
    result.applied = reply->element[0]->integer == 1;
    if (reply->element[1]->type == REDIS_REPLY_STRING) {
        result.previous = codec_.decode(reply_str(reply->element[1]));
    }
    return result;
}

bool RedisBackend::del(const std::string& key) {
    return command_int({"DEL", key}) > 0;
}

bool RedisBackend::has_key(const std::string& key) {
    return command_int({"EXISTS", key}) > 0;
}

bool RedisBackend::touch(const std::string& key, Timeout timeout) {
    if (!timeout) return persist(key);
    return command_int({"PEXPIRE", key, ms_arg(*timeout)}) == 1;
}

std::map<std::string, Value> RedisBackend::get_many(const std::vector<std::string>& keys) {
    std::map<std::string, Value> out;
    if (keys.empty()) return out;
    std::vector<std::string> args{"MGET"};
    args.insert(args.end(), keys.begin(), keys.end());
    auto reply = command(args);
    for (size_t i = 0; i < reply->elements && i < keys.size(); i++) {
        if (reply->element[i]->type != REDIS_REPLY_STRING) continue;
        out.emplace(keys[i], codec_.decode(reply_str(reply->element[i])));
    }
    return out;
}

void RedisBackend::set_many(const std::map<std::string, Value>& data, Timeout timeout) {
    if (data.empty()) return;
    if (timeout) {
        for (const auto& [k, v] : data) set(k, v, timeout);
        return;
    }
    std::vector<std::string> args{"MSET"};
    for (const auto& [k, v] : data) {
        args.push_back(k);
        args.push_back(codec_.encode(v));
    }
    command(args);
}

int64_t RedisBackend::delete_many(const std::vector<std::string>& keys) {
    if (keys.empty()) return 0;
    std::vector<std::string> args{"DEL"};
    args.insert(args.end(), keys.begin(), keys.end());
    return command_int(args);
}

int64_t RedisBackend::incr(const std::string& key, int64_t delta) {
    auto reply = call({"EVAL", kIncrScript, "1", key, std::to_string(delta)});
    if (reply->type == REDIS_REPLY_ERROR) {
        std::string msg = reply_str(reply.get());
        LOG_ERR("[redis] incr failed: %s", msg.c_str());
        if (contains(msg, "no such key")) throw PreconditionError(key, "Key '" + key + "' not found");
        if (contains(msg, "not an integer") || contains(msg, "WRONGTYPE") || contains(msg, "overflow")) {
            throw PreconditionError(key, "Value at key '" + key + "' is not an integer");
        }
        throw DatabaseError(msg);
    }
    return reply->integer;
}

void RedisBackend::clear() {
    command({"FLUSHDB"});
}

std::optional<KeyType> RedisBackend::type(const std::string& key) {
    auto reply = command({"TYPE", key});
    std::string t = reply_str(reply.get());
    if (t == "none") return std::nullopt;
    auto kt = parse_key_type(t);
    if (!kt) LOG_WRN("[redis] Key '%s' has type '%s' outside the cache model", key.c_str(), t.c_str());
    return kt;
}

// --- TTL --------------------------------------------------------------------

namespace {

std::optional<int64_t> ttl_result(int64_t v) {
    if (v == -1) return std::nullopt;
    if (v == -2) return kKeyAbsent;
    return v;
}

} // namespace

std::optional<int64_t> RedisBackend::ttl(const std::string& key) {
    return ttl_result(command_int({"TTL", key}));
}

std::optional<int64_t> RedisBackend::pttl(const std::string& key) {
    return ttl_result(command_int({"PTTL", key}));
}

std::optional<int64_t> RedisBackend::expiretime(const std::string& key) {
    return ttl_result(command_int({"EXPIRETIME", key}));
}

bool RedisBackend::expire(const std::string& key, double seconds) {
    return command_int({"PEXPIRE", key, ms_arg(seconds)}) == 1;
}

bool RedisBackend::pexpire(const std::string& key, int64_t milliseconds) {
    return command_int({"PEXPIRE", key, std::to_string(milliseconds)}) == 1;
}

bool RedisBackend::expireat(const std::string& key, int64_t unix_seconds) {
    return command_int({"EXPIREAT", key, std::to_string(unix_seconds)}) == 1;
}

bool RedisBackend::pexpireat(const std::string& key, int64_t unix_milliseconds) {
    return command_int({"PEXPIREAT", key, std::to_string(unix_milliseconds)}) == 1;
}

bool RedisBackend::persist(const std::string& key) {
    return command_int({"PERSIST", key}) == 1;
}

// --- Key space --------------------------------------------------------------

std::vector<std::string> RedisBackend::keys(const std::string& pattern) {
    auto reply = command({"KEYS", pattern});
    std::vector<std::string> out;
    for (size_t i = 0; i < reply->elements; i++) out.push_back(reply_str(reply->element[i]));
    std::sort(out.begin(), out.end());
    return out;
}

ScanResult RedisBackend::scan(int64_t cursor, const std::optional<std::string>& match,
                              std::optional<int64_t> count, std::optional<KeyType> type) {
    std::vector<std::string> args{"SCAN", std::to_string(cursor)};
    if (match) args.insert(args.end(), {"MATCH", *match});
    args.insert(args.end(), {"COUNT", std::to_string(count.value_or(scan_itersize_))});
    if (type) args.insert(args.end(), {"TYPE", key_type_str(*type)});

    auto reply = command(args);
    if (reply->type != REDIS_REPLY_ARRAY || reply->elements != 2) {
        throw DatabaseError("unexpected SCAN reply");
    }
    ScanResult result;
    result.next_cursor = std::strtoll(reply_str(reply->element[0]).c_str(), nullptr, 10);
    auto* keys = reply->element[1];
    for (size_t i = 0; i < keys->elements; i++) result.keys.push_back(reply_str(keys->element[i]));
    return result;
}

// SCAN + DEL; FLUSHDB would take unrelated keys with it
int64_t RedisBackend::delete_pattern(const std::string& pattern, std::optional<int64_t> itersize) {
    int64_t total = 0;
    int64_t cursor = 0;
    do {
        ScanResult page = scan(cursor, pattern, itersize.value_or(scan_itersize_));
        total += delete_many(page.keys);
        cursor = page.next_cursor;
    } while (cursor != 0);
    LOG_DBG("[redis] delete_pattern '%s' removed %lld keys", pattern.c_str(), static_cast<long long>(total));
    return total;
}

void RedisBackend::rename(const std::string& src, const std::string& dst) {
    auto reply = call({"RENAME", src, dst});
    if (reply->type == REDIS_REPLY_ERROR) {
        std::string msg = reply_str(reply.get());
        LOG_ERR("[redis] rename failed: %s", msg.c_str());
        if (contains(msg, "no such key")) throw PreconditionError(src, "Key '" + src + "' not found");
        throw DatabaseError(msg);
    }
}

bool RedisBackend::renamenx(const std::string& src, const std::string& dst) {
    auto reply = call({"RENAMENX", src, dst});
    if (reply->type == REDIS_REPLY_ERROR) {
        std::string msg = reply_str(reply.get());
        LOG_ERR("[redis] renamenx failed: %s", msg.c_str());
        if (contains(msg, "no such key")) throw PreconditionError(src, "Key '" + src + "' not found");
        throw DatabaseError(msg);
    }
    return reply->integer == 1;
}

// --- Hashes -----------------------------------------------------------------

int64_t RedisBackend::hset(const std::string& key, const HashMap& mapping) {
    if (mapping.empty()) return 0;
    std::vector<std::string> args{"HSET", key};
    for (const auto& [field, value] : mapping) {
        args.push_back(field);
        args.push_back(codec_.encode(value));
    }
    return command_int(args);
}

bool RedisBackend::hsetnx(const std::string& key, const std::string& field, const Value& value) {
    return command_int({"HSETNX", key, field, codec_.encode(value)}) == 1;
}

std::optional<Value> RedisBackend::hget(const std::string& key, const std::string& field) {
    return command_value({"HGET", key, field});
}

std::vector<std::optional<Value>> RedisBackend::hmget(const std::string& key,
                                                      const std::vector<std::string>& fields) {
    std::vector<std::optional<Value>> out;
    if (fields.empty()) return out;
    std::vector<std::string> args{"HMGET", key};
    args.insert(args.end(), fields.begin(), fields.end());
    auto reply = command(args);
    for (size_t i = 0; i < reply->elements; i++) {
        if (reply->element[i]->type == REDIS_REPLY_NIL) out.emplace_back(std::nullopt);
        else out.emplace_back(codec_.decode(reply_str(reply->element[i])));
    }
    return out;
}

HashMap RedisBackend::hgetall(const std::string& key) {
    auto reply = command({"HGETALL", key});
    HashMap out;
    for (size_t i = 0; i + 1 < reply->elements; i += 2) {
        out.emplace(reply_str(reply->element[i]), codec_.decode(reply_str(reply->element[i + 1])));
    }
    return out;
}

int64_t RedisBackend::hdel(const std::string& key, const std::vector<std::string>& fields) {
    if (fields.empty()) return 0;
    std::vector<std::string> args{"HDEL", key};
    args.insert(args.end(), fields.begin(), fields.end());
    return command_int(args);
}

bool RedisBackend::hexists(const std::string& key, const std::string& field) {
    return command_int({"HEXISTS", key, field}) == 1;
}

int64_t RedisBackend::hlen(const std::string& key) {
    return command_int({"HLEN", key});
}

std::vector<std::string> RedisBackend::hkeys(const std::string& key) {
    auto reply = command({"HKEYS", key});
    std::vector<std::string> out;
    for (size_t i = 0; i < reply->elements; i++) out.push_back(reply_str(reply->element[i]));
    std::sort(out.begin(), out.end());
    return out;
}

ValueList RedisBackend::hvals(const std::string& key) {
    // Field order, matching hkeys()
    ValueList out;
    for (auto& [field, value] : hgetall(key)) out.push_back(std::move(value));
    return out;
}

int64_t RedisBackend::hincrby(const std::string& key, const std::string& field, int64_t amount) {
    auto reply = call({"HINCRBY", key, field, std::to_string(amount)});
    if (reply->type == REDIS_REPLY_ERROR) {
        LOG_ERR("[redis] hincrby failed: %s", reply_str(reply.get()).c_str());
        throw PreconditionError(key, "Hash field '" + field + "' of key '" + key + "' is not an integer: " +
                                     reply_str(reply.get()));
    }
    return reply->integer;
}

double RedisBackend::hincrbyfloat(const std::string& key, const std::string& field, double amount) {
    auto reply = call({"HINCRBYFLOAT", key, field, score_arg(amount)});
    if (reply->type == REDIS_REPLY_ERROR) {
        LOG_ERR("[redis] hincrbyfloat failed: %s", reply_str(reply.get()).c_str());
        throw PreconditionError(key, "Hash field '" + field + "' of key '" + key + "' is not a number: " +
                                     reply_str(reply.get()));
    }
    return parse_score(reply.get());
}

// --- Lists ------------------------------------------------------------------

int64_t RedisBackend::lpush(const std::string& key, const ValueList& values) {
    if (values.empty()) return llen(key);
    std::vector<std::string> args{"LPUSH", key};
    append_values(args, codec_, values);
    return command_int(args);
}

int64_t RedisBackend::rpush(const std::string& key, const ValueList& values) {
    if (values.empty()) return llen(key);
    std::vector<std::string> args{"RPUSH", key};
    append_values(args, codec_, values);
    return command_int(args);
}

std::optional<Value> RedisBackend::lpop(const std::string& key) {
    return command_value({"LPOP", key});
}

ValueList RedisBackend::lpop(const std::string& key, int64_t count) {
    if (count < 0) throw PreconditionError(key, "lpop count must be positive");
    if (count == 0) return {};
    return command_values({"LPOP", key, std::to_string(count)});
}

std::optional<Value> RedisBackend::rpop(const std::string& key) {
    return command_value({"RPOP", key});
}

ValueList RedisBackend::rpop(const std::string& key, int64_t count) {
    if (count < 0) throw PreconditionError(key, "rpop count must be positive");
    if (count == 0) return {};
    return command_values({"RPOP", key, std::to_string(count)});
}

ValueList RedisBackend::lrange(const std::string& key, int64_t start, int64_t end) {
    return command_values({"LRANGE", key, std::to_string(start), std::to_string(end)});
}

std::optional<Value> RedisBackend::lindex(const std::string& key, int64_t index) {
    return command_value({"LINDEX", key, std::to_string(index)});
}

int64_t RedisBackend::llen(const std::string& key) {
    return command_int({"LLEN", key});
}

std::optional<int64_t> RedisBackend::lpos(const std::string& key, const Value& value, const LposOptions& opts) {
    auto found = lpos_count(key, value, 1, opts);
    if (found.empty()) return std::nullopt;
    return found.front();
}

std::vector<int64_t> RedisBackend::lpos_count(const std::string& key, const Value& value, int64_t count,
                                              const LposOptions& opts) {
    if (count < 0) throw PreconditionError(key, "lpos count can't be negative");
    std::vector<std::string> args{"LPOS", key, codec_.encode(value)};
    // The server rejects RANK 0; it means the same as the default
    if (opts.rank && *opts.rank != 0) args.insert(args.end(), {"RANK", std::to_string(*opts.rank)});
    args.insert(args.end(), {"COUNT", std::to_string(count)});
    if (opts.maxlen) args.insert(args.end(), {"MAXLEN", std::to_string(*opts.maxlen)});

    auto reply = command(args);
    std::vector<int64_t> out;
    for (size_t i = 0; i < reply->elements; i++) out.push_back(reply->element[i]->integer);
    return out;
}

std::optional<Value> RedisBackend::lmove(const std::string& src, const std::string& dst,
                                         ListEnd wherefrom, ListEnd whereto) {
    return command_value({"LMOVE", src, dst, list_end_str(wherefrom), list_end_str(whereto)});
}

int64_t RedisBackend::lrem(const std::string& key, int64_t count, const Value& value) {
    return command_int({"LREM", key, std::to_string(count), codec_.encode(value)});
}

void RedisBackend::ltrim(const std::string& key, int64_t start, int64_t end) {
    command({"LTRIM", key, std::to_string(start), std::to_string(end)});
}

void RedisBackend::lset(const std::string& key, int64_t index, const Value& value) {
    auto reply = call({"LSET", key, std::to_string(index), codec_.encode(value)});
    if (reply->type == REDIS_REPLY_ERROR) {
        std::string msg = reply_str(reply.get());
        LOG_ERR("[redis] lset failed: %s", msg.c_str());
        if (contains(msg, "no such key") || contains(msg, "out of range")) throw IndexOutOfRangeError(key, index);
        throw DatabaseError(msg);
    }
}

int64_t RedisBackend::linsert(const std::string& key, InsertWhere where, const Value& pivot, const Value& value) {
    return command_int({"LINSERT", key, where == InsertWhere::BEFORE ? "BEFORE" : "AFTER",
                        codec_.encode(pivot), codec_.encode(value)});
}

// --- Sets -------------------------------------------------------------------

int64_t RedisBackend::sadd(const std::string& key, const ValueList& members) {
    if (members.empty()) return 0;
    std::vector<std::string> args{"SADD", key};
    append_values(args, codec_, members);
    return command_int(args);
}

int64_t RedisBackend::scard(const std::string& key) {
    return command_int({"SCARD", key});
}

bool RedisBackend::sismember(const std::string& key, const Value& member) {
    return command_int({"SISMEMBER", key, codec_.encode(member)}) == 1;
}

std::vector<bool> RedisBackend::smismember(const std::string& key, const ValueList& members) {
    std::vector<bool> out;
    if (members.empty()) return out;
    std::vector<std::string> args{"SMISMEMBER", key};
    append_values(args, codec_, members);
    auto reply = command(args);
    for (size_t i = 0; i < reply->elements; i++) out.push_back(reply->element[i]->integer == 1);
    return out;
}

ValueSet RedisBackend::smembers(const std::string& key) {
    return command_set({"SMEMBERS", key});
}

std::optional<Value> RedisBackend::srandmember(const std::string& key) {
    return command_value({"SRANDMEMBER", key});
}

ValueList RedisBackend::srandmember(const std::string& key, int64_t count) {
    return command_values({"SRANDMEMBER", key, std::to_string(count)});
}

std::optional<Value> RedisBackend::spop(const std::string& key) {
    return command_value({"SPOP", key});
}

ValueList RedisBackend::spop(const std::string& key, int64_t count) {
    if (count < 0) throw PreconditionError(key, "spop count must be positive");
    return command_values({"SPOP", key, std::to_string(count)});
}

int64_t RedisBackend::srem(const std::string& key, const ValueList& members) {
    if (members.empty()) return 0;
    std::vector<std::string> args{"SREM", key};
    append_values(args, codec_, members);
    return command_int(args);
}

bool RedisBackend::smove(const std::string& src, const std::string& dst, const Value& member) {
    return command_int({"SMOVE", src, dst, codec_.encode(member)}) == 1;
}

ValueSet RedisBackend::sdiff(const std::vector<std::string>& keys) {
    if (keys.empty()) return {};
    std::vector<std::string> args{"SDIFF"};
    args.insert(args.end(), keys.begin(), keys.end());
    return command_set(args);
}

ValueSet RedisBackend::sinter(const std::vector<std::string>& keys) {
    if (keys.empty()) return {};
    std::vector<std::string> args{"SINTER"};
    args.insert(args.end(), keys.begin(), keys.end());
    return command_set(args);
}

ValueSet RedisBackend::sunion(const std::vector<std::string>& keys) {
    if (keys.empty()) return {};
    std::vector<std::string> args{"SUNION"};
    args.insert(args.end(), keys.begin(), keys.end());
    return command_set(args);
}

int64_t RedisBackend::sdiffstore(const std::string& dest, const std::vector<std::string>& keys) {
    if (keys.empty()) {
        del(dest);
        return 0;
    }
    std::vector<std::string> args{"SDIFFSTORE", dest};
    args.insert(args.end(), keys.begin(), keys.end());
    return command_int(args);
}

int64_t RedisBackend::sinterstore(const std::string& dest, const std::vector<std::string>& keys) {
    if (keys.empty()) {
        del(dest);
        return 0;
    }
    std::vector<std::string> args{"SINTERSTORE", dest};
    args.insert(args.end(), keys.begin(), keys.end());
    return command_int(args);
}

int64_t RedisBackend::sunionstore(const std::string& dest, const std::vector<std::string>& keys) {
    if (keys.empty()) {
        del(dest);
        return 0;
    }
    std::vector<std::string> args{"SUNIONSTORE", dest};
    args.insert(args.end(), keys.begin(), keys.end());
    return command_int(args);
}

// --- Sorted sets ------------------------------------------------------------

int64_t RedisBackend::zadd(const std::string& key, const std::vector<ScoredMember>& members, ZAddFlags flags) {
    if (members.empty()) return 0;
    for (const auto& sm : members) {
        if (std::isnan(sm.score)) throw PreconditionError(key, "zadd score is not a valid float");
    }

    // GT together with LT never updates, which leaves NX (insert-only)
    if (flags.gt && flags.lt) {
        if (flags.xx) return 0;
        flags.nx = true;
    }
    std::vector<std::string> args{"ZADD", key};
    if (flags.nx) args.push_back("NX");
    else if (flags.xx) args.push_back("XX");
    if (!flags.nx) {
        if (flags.gt) args.push_back("GT");
        else if (flags.lt) args.push_back("LT");
    }
    if (flags.ch) args.push_back("CH");
    for (const auto& sm : members) {
        args.push_back(score_arg(sm.score));
        args.push_back(codec_.encode(sm.member));
    }
    return command_int(args);
}

int64_t RedisBackend::zcard(const std::string& key) {
    return command_int({"ZCARD", key});
}

int64_t RedisBackend::zcount(const std::string& key, const ScoreBound& min, const ScoreBound& max) {
    return command_int({"ZCOUNT", key, bound_arg(min), bound_arg(max)});
}

double RedisBackend::zincrby(const std::string& key, double amount, const Value& member) {
    auto reply = call({"ZINCRBY", key, score_arg(amount), codec_.encode(member)});
    if (reply->type == REDIS_REPLY_ERROR) {
        LOG_ERR("[redis] zincrby failed: %s", reply_str(reply.get()).c_str());
        throw PreconditionError(key, "zincrby on key '" + key + "' failed: " + reply_str(reply.get()));
    }
    return parse_score(reply.get());
}

std::vector<ScoredMember> RedisBackend::zpopmin(const std::string& key, int64_t count) {
    if (count < 0) throw PreconditionError(key, "zpopmin count must be positive");
    if (count == 0) return {};
    return command_scored({"ZPOPMIN", key, std::to_string(count)});
}

std::vector<ScoredMember> RedisBackend::zpopmax(const std::string& key, int64_t count) {
    if (count < 0) throw PreconditionError(key, "zpopmax count must be positive");
    if (count == 0) return {};
    return command_scored({"ZPOPMAX", key, std::to_string(count)});
}

std::vector<ScoredMember> RedisBackend::zrange_withscores(const std::string& key, int64_t start, int64_t end) {
    return command_scored({"ZRANGE", key, std::to_string(start), std::to_string(end), "WITHSCORES"});
}

std::vector<ScoredMember> RedisBackend::zrevrange_withscores(const std::string& key, int64_t start, int64_t end) {
    return command_scored({"ZREVRANGE", key, std::to_string(start), std::to_string(end), "WITHSCORES"});
}

std::vector<ScoredMember> RedisBackend::zrangebyscore_withscores(
    const std::string& key, const ScoreBound& min, const ScoreBound& max, std::optional<RangeLimit> limit) {
    std::vector<std::string> args{"ZRANGEBYSCORE", key, bound_arg(min), bound_arg(max), "WITHSCORES"};
    if (limit) args.insert(args.end(), {"LIMIT", std::to_string(limit->offset), std::to_string(limit->count)});
    return command_scored(args);
}

std::vector<ScoredMember> RedisBackend::zrevrangebyscore_withscores(
    const std::string& key, const ScoreBound& max, const ScoreBound& min, std::optional<RangeLimit> limit) {
    std::vector<std::string> args{"ZREVRANGEBYSCORE", key, bound_arg(max), bound_arg(min), "WITHSCORES"};
    if (limit) args.insert(args.end(), {"LIMIT", std::to_string(limit->offset), std::to_string(limit->count)});
    return command_scored(args);
}

std::optional<int64_t> RedisBackend::zrank(const std::string& key, const Value& member) {
    auto reply = command({"ZRANK", key, codec_.encode(member)});
    if (reply->type != REDIS_REPLY_INTEGER) return std::nullopt;
    return reply->integer;
}

std::optional<int64_t> RedisBackend::zrevrank(const std::string& key, const Value& member) {
    auto reply = command({"ZREVRANK", key, codec_.encode(member)});
    if (reply->type != REDIS_REPLY_INTEGER) return std::nullopt;
    return reply->integer;
}

int64_t RedisBackend::zrem(const std::string& key, const ValueList& members) {
    if (members.empty()) return 0;
    std::vector<std::string> args{"ZREM", key};
    append_values(args, codec_, members);
    return command_int(args);
}

int64_t RedisBackend::zremrangebyscore(const std::string& key, const ScoreBound& min, const ScoreBound& max) {
    return command_int({"ZREMRANGEBYSCORE", key, bound_arg(min), bound_arg(max)});
}

int64_t RedisBackend::zremrangebyrank(const std::string& key, int64_t start, int64_t end) {
    return command_int({"ZREMRANGEBYRANK", key, std::to_string(start), std::to_string(end)});
}

std::optional<double> RedisBackend::zscore(const std::string& key, const Value& member) {
    auto reply = command({"ZSCORE", key, codec_.encode(member)});
    if (reply->type == REDIS_REPLY_NIL) return std::nullopt;
    return parse_score(reply.get());
}

std::vector<std::optional<double>> RedisBackend::zmscore(const std::string& key, const ValueList& members) {
    std::vector<std::optional<double>> out;
    if (members.empty()) return out;
    std::vector<std::string> args{"ZMSCORE", key};
    append_values(args, codec_, members);
    auto reply = command(args);
    for (size_t i = 0; i < reply->elements; i++) {
        if (reply->element[i]->type == REDIS_REPLY_NIL) out.emplace_back(std::nullopt);
        else out.emplace_back(parse_score(reply->element[i]));
    }
    return out;
}

// --- Native-only surface ----------------------------------------------------

std::string RedisBackend::xadd(const std::string& key, const std::map<std::string, std::string>& fields,
                               const std::string& id) {
    std::vector<std::string> args{"XADD", key, id};
    for (const auto& [f, v] : fields) {
        args.push_back(f);
        args.push_back(v);
    }
    return reply_str(command(args).get());
}

int64_t RedisBackend::xlen(const std::string& key) {
    return command_int({"XLEN", key});
}

int64_t RedisBackend::xtrim(const std::string& key, int64_t maxlen) {
    return command_int({"XTRIM", key, "MAXLEN", std::to_string(maxlen)});
}

int64_t RedisBackend::xdel(const std::string& key, const std::vector<std::string>& ids) {
    if (ids.empty()) return 0;
    std::vector<std::string> args{"XDEL", key};
    args.insert(args.end(), ids.begin(), ids.end());
    return command_int(args);
}

Value RedisBackend::eval(const std::string& script, const std::vector<std::string>& keys,
                         const std::vector<std::string>& args) {
    std::vector<std::string> cmd{"EVAL", script, std::to_string(keys.size())};
    cmd.insert(cmd.end(), keys.begin(), keys.end());
    cmd.insert(cmd.end(), args.begin(), args.end());
    return reply_to_value(command(cmd).get());
}

std::optional<std::pair<std::string, Value>> RedisBackend::blocking_pop(
    const char* cmd, const std::vector<std::string>& keys, double timeout) {
    if (keys.empty()) return std::nullopt;
    std::vector<std::string> args{cmd};
    args.insert(args.end(), keys.begin(), keys.end());
    args.push_back(score_arg(timeout));
    auto reply = command(args);
    if (reply->type != REDIS_REPLY_ARRAY || reply->elements != 2) return std::nullopt;
    return std::make_pair(reply_str(reply->element[0]), codec_.decode(reply_str(reply->element[1])));
}

std::optional<std::pair<std::string, Value>> RedisBackend::blpop(const std::vector<std::string>& keys,
                                                                 double timeout) {
    return blocking_pop("BLPOP", keys, timeout);
}

std::optional<std::pair<std::string, Value>> RedisBackend::brpop(const std::vector<std::string>& keys,
                                                                 double timeout) {
    return blocking_pop("BRPOP", keys, timeout);
}

std::optional<Value> RedisBackend::blmove(const std::string& src, const std::string& dst,
                                          ListEnd wherefrom, ListEnd whereto, double timeout) {
    return command_value({"BLMOVE", src, dst, list_end_str(wherefrom), list_end_str(whereto),
                          score_arg(timeout)});
}

std::unique_ptr<CacheLock> RedisBackend::lock(const std::string& name, std::optional<double> timeout) {
    return std::make_unique<RedisLock>(*this, name, timeout);
}

std::map<std::string, std::string> RedisBackend::info(const std::string& section) {
    std::vector<std::string> args{"INFO"};
    if (!section.empty()) args.push_back(section);
    std::string text = reply_str(command(args).get());

    std::map<std::string, std::string> out;
    size_t start = 0;
    while (start < text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string::npos) end = text.size();
        std::string line = text.substr(start, end - start);
        start = end + 1;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() || line[0] == '#') continue;
        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;
        out[line.substr(0, colon)] = line.substr(colon + 1);
    }
    return out;
}

int64_t RedisBackend::slowlog_len() {
    return command_int({"SLOWLOG", "LEN"});
}

} // namespace cachex
