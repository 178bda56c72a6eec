#include "postgres_backend.hpp"
#include <limits>
#include "glob_pattern.hpp"

namespace cachex {

namespace {

// Registry rows whose expiry is still ahead
const std::string kLive = " AND (expires_at IS NULL OR expires_at > NOW())";

std::optional<KeyType> key_type_from_id(int64_t id) {
    if (id < 0 || id > static_cast<int64_t>(KeyType::ZSET)) return std::nullopt;
    return static_cast<KeyType>(id);
}

} // namespace

PostgresBackend::PostgresBackend(const PostgresConfig& pg, const CodecConfig& codec, int64_t scan_itersize)
    : CacheBackend(scan_itersize),
      tables_(pg.schema, pg.table),
      codec_(codec),
      unlogged_(pg.unlogged),
      pool_(pg.connection_string(), static_cast<size_t>(pg.pool_size)),
      rng_(std::random_device{}()) {
    LOG_INF("[postgresql] Cache tables %s{,_hashes,_lists,_sets,_zsets}, pool size %d",
        tables_.main().c_str(), pg.pool_size);
}

// --- Helpers ----------------------------------------------------------------

std::string PostgresBackend::bind_list(PgParams& params, const std::vector<std::string>& values, bool as_bytes) {
    std::string out;
    for (size_t i = 0; i < values.size(); i++) {
        if (i) out += ", ";
        out += params.next_placeholder();
        if (as_bytes) params.bytes(values[i]);
        else params.text(values[i]);
    }
    return out;
}

std::string PostgresBackend::expiry_expr(PgParams& params, Timeout timeout) {
    if (!timeout) return "NULL";
    std::string ph = params.next_placeholder();
    params.dbl(*timeout);
    return "NOW() + make_interval(secs => " + ph + ")";
}

void PostgresBackend::delete_aux(PgConnection& c, const std::string& key, KeyType type) {
    const char* tmpl = nullptr;
    switch (type) {
        case KeyType::HASH: tmpl = "DELETE FROM {hashes} WHERE key = $1"; break;
        case KeyType::LIST: tmpl = "DELETE FROM {lists} WHERE key = $1"; break;
        case KeyType::SET:  tmpl = "DELETE FROM {sets} WHERE key = $1"; break;
        case KeyType::ZSET: tmpl = "DELETE FROM {zsets} WHERE key = $1"; break;
        case KeyType::STRING: return;
    }
    c.exec(sql(tmpl), PgParams().text(key));
}

void PostgresBackend::delete_all_aux(PgConnection& c, const std::string& key) {
    for (const auto& t : tables_.aux()) {
        c.exec("DELETE FROM " + t + " WHERE key = $1", PgParams().text(key));
    }
}

bool PostgresBackend::delete_key(PgConnection& c, const std::string& key) {
    delete_all_aux(c, key);
    auto res = c.exec(sql("DELETE FROM {main} WHERE key = $1 "
                          "RETURNING (expires_at IS NULL OR expires_at > NOW())"),
                      PgParams().text(key));
    return !res.empty() && res.text(0, 0) == "t";
}

void PostgresBackend::purge_if_expired(PgConnection& c, const std::string& key) {
    auto res = c.exec(sql("DELETE FROM {main} WHERE key = $1 "
                          "AND expires_at IS NOT NULL AND expires_at <= NOW() RETURNING key"),
                      PgParams().text(key));
    if (!res.empty()) delete_all_aux(c, key);
}

bool PostgresBackend::is_live(PgConnection& c, const std::string& key, std::optional<KeyType> type) {
    PgParams p;
    p.text(key);
    std::string q = "SELECT 1 FROM {main} WHERE key = $1" + kLive;
    if (type) {
        q += " AND type = $2";
        p.text(type_id(*type));
    }
    return !c.exec(sql(q), p).empty();
}

void PostgresBackend::ensure_key(PgConnection& c, const std::string& key, KeyType type) {
    auto res = c.exec(sql("SELECT type, (expires_at IS NOT NULL AND expires_at <= NOW()) "
                          "FROM {main} WHERE key = $1 FOR UPDATE"),
                      PgParams().text(key));
    if (!res.empty()) {
        auto old_type = key_type_from_id(res.int64(0, 0));
        bool expired = res.text(0, 1) == "t";
        if (expired) {
            delete_all_aux(c, key);
            c.exec(sql("DELETE FROM {main} WHERE key = $1"), PgParams().text(key));
        } else if (old_type && *old_type != type) {
            delete_aux(c, key, *old_type);
        }
    }

    c.exec(sql("INSERT INTO {main} AS m (key, type) VALUES ($1, $2) "
               "ON CONFLICT (key) DO UPDATE SET type = EXCLUDED.type, value = NULL "
               "WHERE m.type <> EXCLUDED.type"),
           PgParams().text(key).text(type_id(type)));
}

void PostgresBackend::drop_if_empty(PgConnection& c, const std::string& key, KeyType type) {
    const char* aux = nullptr;
    switch (type) {
        case KeyType::HASH: aux = "{hashes}"; break;
        case KeyType::LIST: aux = "{lists}"; break;
        case KeyType::SET:  aux = "{sets}"; break;
        case KeyType::ZSET: aux = "{zsets}"; break;
        case KeyType::STRING: return;
    }
    c.exec(sql(std::string("DELETE FROM {main} WHERE key = $1 AND type = $2 "
                           "AND NOT EXISTS (SELECT 1 FROM ") + aux + " WHERE key = $1)"),
           PgParams().text(key).text(type_id(type)));
}

void PostgresBackend::upsert_string(PgConnection& c, const std::string& key, const std::string& bytes,
                                    Timeout timeout) {
    delete_all_aux(c, key);
    PgParams p;
    p.text(key).text(type_id(KeyType::STRING)).bytes(bytes);
    std::string expiry = expiry_expr(p, timeout);
    c.exec(sql("INSERT INTO {main} (key, type, value, expires_at) VALUES ($1, $2, $3, " + expiry + ") "
               "ON CONFLICT (key) DO UPDATE SET type = EXCLUDED.type, value = EXCLUDED.value, "
               "expires_at = EXCLUDED.expires_at"), p);
}

// --- Schema and maintenance -------------------------------------------------

void PostgresBackend::create_schema() {
    LOG_INF("[postgresql] Creating %scache tables %s",
        unlogged_ ? "UNLOGGED " : "", tables_.main().c_str());
    run("create_schema", [&](PgConnection& c) {
        for (const auto& stmt : tables_.create_statements(unlogged_)) c.exec(stmt);
    });
}

void PostgresBackend::drop_schema() {
    LOG_WRN("[postgresql] DROPPING cache tables %s (all cached data will be lost)",
        tables_.main().c_str());
    run("drop_schema", [&](PgConnection& c) {
        for (const auto& stmt : tables_.drop_statements()) c.exec(stmt);
    });
}

int64_t PostgresBackend::purge_expired() {
    int64_t purged = run("purge_expired", [&](PgConnection& c) {
        for (const auto& t : tables_.aux()) {
            c.exec(sql("DELETE FROM " + t + " a USING {main} m WHERE a.key = m.key "
                       "AND m.expires_at IS NOT NULL AND m.expires_at <= NOW()"));
        }
        return c.exec(sql("DELETE FROM {main} WHERE expires_at IS NOT NULL AND expires_at <= NOW()"))
            .affected();
    });
    if (purged > 0) LOG_INF("[postgresql] Purged %lld expired keys", static_cast<long long>(purged));
    return purged;
}

StorageStats PostgresBackend::storage_stats() {
    return run("storage_stats", [&](PgConnection& c) {
        StorageStats stats;
        auto res = c.exec(sql("SELECT type, "
                              "COUNT(*) FILTER (WHERE expires_at IS NULL OR expires_at > NOW()), "
                              "COUNT(*) FILTER (WHERE expires_at IS NOT NULL AND expires_at <= NOW()) "
                              "FROM {main} GROUP BY type ORDER BY type"));
        for (int i = 0; i < res.rows(); i++) {
            if (auto t = key_type_from_id(res.int64(i, 0))) stats.live_keys[*t] = res.int64(i, 1);
            stats.expired_keys += res.int64(i, 2);
        }

        PgParams p;
        std::vector<std::string> names{tables_.main()};
        for (const auto& t : tables_.aux()) names.push_back(t);
        std::string list = bind_list(p, names, false);
        auto size = c.exec("SELECT COALESCE(SUM(pg_total_relation_size(to_regclass(n))), 0)::bigint "
                           "FROM unnest(ARRAY[" + list + "]::text[]) AS n", p);
        stats.total_bytes = size.int64(0, 0);
        return stats;
    });
}

// --- Strings and core -------------------------------------------------------

void PostgresBackend::set(const std::string& key, const Value& value, Timeout timeout) {
    if (timeout && *timeout == 0) {
        del(key);
        return;
    }
    std::string bytes = codec_.encode(value);
    run("set", [&](PgConnection& c) { upsert_string(c, key, bytes, timeout); });
}

std::optional<Value> PostgresBackend::get(const std::string& key) {
    auto raw = run("get", [&](PgConnection& c) -> std::optional<std::string> {
        auto res = c.exec(sql("SELECT value FROM {main} WHERE key = $1 AND type = $2" + kLive),
                          PgParams().text(key).text(type_id(KeyType::STRING)));
        if (res.empty() || res.is_null(0, 0)) return std::nullopt;
        return res.bytes(0, 0);
    });
    if (!raw) return std::nullopt;
    return codec_.decode(*raw);
}

bool PostgresBackend::add(const std::string& key, const Value& value, Timeout timeout) {
    if (timeout && *timeout == 0) {
        // Would the add have succeeded? Nothing is stored either way.
        return !has_key(key);
    }
    std::string bytes = codec_.encode(value);
    return run("add", [&](PgConnection& c) {
        purge_if_expired(c, key);
        PgParams p;
        p.text(key).text(type_id(KeyType::STRING)).bytes(bytes);
        std::string expiry = expiry_expr(p, timeout);
        return c.exec(sql("INSERT INTO {main} (key, type, value, expires_at) "
                          "VALUES ($1, $2, $3, " + expiry + ") ON CONFLICT (key) DO NOTHING"), p)
                   .affected() > 0;
    });
}

SetResult PostgresBackend::set_with_flags(const std::string& key, const Value& value,
                                          Timeout timeout, SetFlags flags) {
    if (timeout && *timeout == 0) return {};

    std::string bytes = codec_.encode(value);
    std::optional<std::string> previous;
    SetResult result;
    result.applied = run("set_with_flags", [&](PgConnection& c) {
        if (flags.get) {
            auto res = c.exec(sql("SELECT value FROM {main} WHERE key = $1 AND type = $2" + kLive +
                                  " FOR UPDATE"),
                              PgParams().text(key).text(type_id(KeyType::STRING)));
            if (!res.empty() && !res.is_null(0, 0)) previous = res.bytes(0, 0);
        }

        if (flags.nx) {
            // Only an expired holder may be displaced; a live key of any type wins
            purge_if_expired(c, key);
            PgParams p;
            p.text(key).text(type_id(KeyType::STRING)).bytes(bytes);
            std::string expiry = expiry_expr(p, timeout);
            return c.exec(sql("INSERT INTO {main} (key, type, value, expires_at) "
                              "VALUES ($1, $2, $3, " + expiry + ") ON CONFLICT (key) DO NOTHING"), p)
                       .affected() > 0;
        }

        if (flags.xx) {
            PgParams p;
            p.text(key).text(type_id(KeyType::STRING)).bytes(bytes);
            std::string expiry = expiry_expr(p, timeout);
            bool updated = c.exec(sql("UPDATE {main} SET type = $2, value = $3, expires_at = " + expiry +
                                      " WHERE key = $1" + kLive), p).affected() > 0;
            if (updated) delete_all_aux(c, key);
            return updated;
        }

        upsert_string(c, key, bytes, timeout);
        return true;
    });
    if (flags.get && previous) result.previous = codec_.decode(*previous);
    return result;
}

bool PostgresBackend::del(const std::string& key) {
    return run("delete", [&](PgConnection& c) { return delete_key(c, key); });
}

bool PostgresBackend::has_key(const std::string& key) {
    return run("has_key", [&](PgConnection& c) { return is_live(c, key); });
}

bool PostgresBackend::touch(const std::string& key, Timeout timeout) {
    if (!timeout) return persist(key);
    PgParams p;
    p.text(key);
    std::string expr = expiry_expr(p, timeout);
    return set_expiry("touch", key, expr, std::move(p));
}

std::map<std::string, Value> PostgresBackend::get_many(const std::vector<std::string>& keys) {
    if (keys.empty()) return {};
    auto rows = run("get_many", [&](PgConnection& c) {
        PgParams p;
        p.text(type_id(KeyType::STRING));
        std::string list = bind_list(p, keys, false);
        auto res = c.exec(sql("SELECT key, value FROM {main} WHERE type = $1 AND key IN (" + list + ")" +
                              kLive), p);
        std::vector<std::pair<std::string, std::string>> out;
        for (int i = 0; i < res.rows(); i++) {
            if (!res.is_null(i, 1)) out.emplace_back(res.text(i, 0), res.bytes(i, 1));
        }
        return out;
    });

    std::map<std::string, Value> result;
    for (const auto& [k, raw] : rows) result.emplace(k, codec_.decode(raw));
    return result;
}

void PostgresBackend::set_many(const std::map<std::string, Value>& data, Timeout timeout) {
    if (data.empty()) return;
    if (timeout && *timeout == 0) {
        std::vector<std::string> keys;
        for (const auto& kv : data) keys.push_back(kv.first);
        delete_many(keys);
        return;
    }

    std::vector<std::pair<std::string, std::string>> encoded;
    encoded.reserve(data.size());
    for (const auto& [k, v] : data) encoded.emplace_back(k, codec_.encode(v));

    run("set_many", [&](PgConnection& c) {
        for (const auto& [k, bytes] : encoded) upsert_string(c, k, bytes, timeout);
    });
}

int64_t PostgresBackend::delete_many(const std::vector<std::string>& keys) {
    if (keys.empty()) return 0;
    return run("delete_many", [&](PgConnection& c) {
        for (const auto& t : tables_.aux()) {
            PgParams p;
            std::string list = bind_list(p, keys, false);
            c.exec("DELETE FROM " + t + " WHERE key IN (" + list + ")", p);
        }
        PgParams p;
        std::string list = bind_list(p, keys, false);
        auto res = c.exec(sql("DELETE FROM {main} WHERE key IN (" + list + ") "
                              "RETURNING (expires_at IS NULL OR expires_at > NOW())"), p);
        int64_t live = 0;
        for (int i = 0; i < res.rows(); i++) {
            if (res.text(i, 0) == "t") live++;
        }
        return live;
    });
}

int64_t PostgresBackend::incr(const std::string& key, int64_t delta) {
    return run("incr", [&](PgConnection& c) {
        auto res = c.exec(sql("SELECT value FROM {main} WHERE key = $1 AND type = $2" + kLive + " FOR UPDATE"),
                          PgParams().text(key).text(type_id(KeyType::STRING)));
        if (res.empty()) throw PreconditionError(key, "Key '" + key + "' not found");

        std::optional<int64_t> current;
        if (!res.is_null(0, 0)) current = ValueCodec::parse_int(res.bytes(0, 0));
        if (!current) throw PreconditionError(key, "Value at key '" + key + "' is not an integer");

        if ((delta > 0 && *current > std::numeric_limits<int64_t>::max() - delta) ||
            (delta < 0 && *current < std::numeric_limits<int64_t>::min() - delta)) {
            throw PreconditionError(key, "Increment of key '" + key + "' would overflow");
        }
        int64_t next = *current + delta;
        c.exec(sql("UPDATE {main} SET value = $2 WHERE key = $1"),
               PgParams().text(key).bytes(std::to_string(next)));
        return next;
    });
}

void PostgresBackend::clear() {
    run("clear", [&](PgConnection& c) {
        for (const auto& t : tables_.aux()) c.exec("DELETE FROM " + t);
        c.exec(sql("DELETE FROM {main}"));
    });
    LOG_DBG("[postgresql] Cleared %s", tables_.main().c_str());
}

std::optional<KeyType> PostgresBackend::type(const std::string& key) {
    return run("type", [&](PgConnection& c) -> std::optional<KeyType> {
        auto res = c.exec(sql("SELECT type FROM {main} WHERE key = $1" + kLive), PgParams().text(key));
        if (res.empty()) return std::nullopt;
        auto t = key_type_from_id(res.int64(0, 0));
        if (!t) throw DatabaseError("unknown type tag " + res.text(0, 0) + " for key '" + key + "'");
        return t;
    });
}

// --- TTL --------------------------------------------------------------------

std::optional<int64_t> PostgresBackend::ttl_query(const char* op, const std::string& key, const char* expr) {
    return run(op, [&](PgConnection& c) -> std::optional<int64_t> {
        auto res = c.exec(sql(std::string("SELECT ") + expr + " FROM {main} WHERE key = $1" + kLive),
                          PgParams().text(key));
        if (res.empty()) return kKeyAbsent;
        if (res.is_null(0, 0)) return std::nullopt;
        return res.int64(0, 0);
    });
}

std::optional<int64_t> PostgresBackend::ttl(const std::string& key) {
    return ttl_query("ttl", key,
        "GREATEST(0, FLOOR(EXTRACT(EPOCH FROM (expires_at - NOW()))))::bigint");
}

std::optional<int64_t> PostgresBackend::pttl(const std::string& key) {
    return ttl_query("pttl", key,
        "GREATEST(0, FLOOR(EXTRACT(EPOCH FROM (expires_at - NOW())) * 1000))::bigint");
}

std::optional<int64_t> PostgresBackend::expiretime(const std::string& key) {
    return ttl_query("expiretime", key, "FLOOR(EXTRACT(EPOCH FROM expires_at))::bigint");
}

bool PostgresBackend::set_expiry(const char* op, const std::string& key, const std::string& expr,
                                 PgParams params) {
    return run(op, [&](PgConnection& c) {
        return c.exec(sql("UPDATE {main} SET expires_at = " + expr + " WHERE key = $1" + kLive), params)
                   .affected() > 0;
    });
}

bool PostgresBackend::expire(const std::string& key, double seconds) {
    return set_expiry("expire", key, "NOW() + make_interval(secs => $2)",
                      std::move(PgParams().text(key).dbl(seconds)));
}

bool PostgresBackend::pexpire(const std::string& key, int64_t milliseconds) {
    return set_expiry("pexpire", key, "NOW() + make_interval(secs => $2)",
                      std::move(PgParams().text(key).dbl(static_cast<double>(milliseconds) / 1000.0)));
}

bool PostgresBackend::expireat(const std::string& key, int64_t unix_seconds) {
    return set_expiry("expireat", key, "to_timestamp($2)",
                      std::move(PgParams().text(key).dbl(static_cast<double>(unix_seconds))));
}

bool PostgresBackend::pexpireat(const std::string& key, int64_t unix_milliseconds) {
    return set_expiry("pexpireat", key, "to_timestamp($2)",
                      std::move(PgParams().text(key).dbl(static_cast<double>(unix_milliseconds) / 1000.0)));
}

bool PostgresBackend::persist(const std::string& key) {
    return run("persist", [&](PgConnection& c) {
        return c.exec(sql("UPDATE {main} SET expires_at = NULL "
                          "WHERE key = $1 AND expires_at IS NOT NULL AND expires_at > NOW()"),
                      PgParams().text(key)).affected() > 0;
    });
}

// --- Key space --------------------------------------------------------------

std::vector<std::string> PostgresBackend::keys(const std::string& pattern) {
    SqlPattern sp = glob_to_sql(pattern);
    return run("keys", [&](PgConnection& c) {
        auto res = c.exec(sql(std::string("SELECT key FROM {main} WHERE key ") + sp.op() + " $1" + kLive +
                              " ORDER BY key"),
                          PgParams().text(sp.pattern));
        std::vector<std::string> out;
        out.reserve(res.rows());
        for (int i = 0; i < res.rows(); i++) out.push_back(res.text(i, 0));
        return out;
    });
}

ScanResult PostgresBackend::scan(int64_t cursor, const std::optional<std::string>& match,
                                 std::optional<int64_t> count, std::optional<KeyType> type) {
    int64_t limit = (count && *count > 0) ? *count : scan_itersize_;
    if (cursor < 0) cursor = 0;

    PgParams p;
    std::string where = "(expires_at IS NULL OR expires_at > NOW())";
    if (match) {
        SqlPattern sp = glob_to_sql(*match);
        where += std::string(" AND key ") + sp.op() + " " + p.next_placeholder();
        p.text(sp.pattern);
    }
    if (type) {
        where += " AND type = " + p.next_placeholder();
        p.text(type_id(*type));
    }
    std::string lim = p.next_placeholder();
    p.int64(limit);
    std::string off = p.next_placeholder();
    p.int64(cursor);

    ScanResult result;
    result.keys = run("scan", [&](PgConnection& c) {
        auto res = c.exec(sql("SELECT key FROM {main} WHERE " + where +
                              " ORDER BY key LIMIT " + lim + " OFFSET " + off), p);
        std::vector<std::string> out;
        out.reserve(res.rows());
        for (int i = 0; i < res.rows(); i++) out.push_back(res.text(i, 0));
        return out;
    });

    int64_t n = static_cast<int64_t>(result.keys.size());
    result.next_cursor = n < limit ? 0 : cursor + n;
    return result;
}

int64_t PostgresBackend::delete_pattern(const std::string& pattern, std::optional<int64_t> itersize) {
    int64_t total = 0;
    for (;;) {
        // Deleting shifts every later offset, so each pass restarts at 0
        ScanResult page = scan(0, pattern, itersize.value_or(scan_itersize_));
        if (page.keys.empty()) break;
        total += delete_many(page.keys);
    }
    LOG_DBG("[postgresql] delete_pattern '%s' removed %lld keys",
        pattern.c_str(), static_cast<long long>(total));
    return total;
}

void PostgresBackend::rename(const std::string& src, const std::string& dst) {
    run("rename", [&](PgConnection& c) {
        if (!is_live(c, src)) throw PreconditionError(src, "Key '" + src + "' not found");
        if (src == dst) return;

        delete_key(c, dst);
        for (const auto& t : tables_.aux()) {
            c.exec("UPDATE " + t + " SET key = $2 WHERE key = $1", PgParams().text(src).text(dst));
        }
        c.exec(sql("UPDATE {main} SET key = $2 WHERE key = $1"), PgParams().text(src).text(dst));
    });
}

bool PostgresBackend::renamenx(const std::string& src, const std::string& dst) {
    return run("renamenx", [&](PgConnection& c) {
        if (!is_live(c, src)) throw PreconditionError(src, "Key '" + src + "' not found");
        if (src == dst || is_live(c, dst)) return false;

        // dst may still hold an expired row
        delete_key(c, dst);
        for (const auto& t : tables_.aux()) {
            c.exec("UPDATE " + t + " SET key = $2 WHERE key = $1", PgParams().text(src).text(dst));
        }
        c.exec(sql("UPDATE {main} SET key = $2 WHERE key = $1"), PgParams().text(src).text(dst));
        return true;
    });
}

} // namespace cachex
