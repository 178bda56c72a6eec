#include "postgres_backend.hpp"
#include <cmath>
#include <limits>

namespace cachex {

int64_t PostgresBackend::hset(const std::string& key, const HashMap& mapping) {
    if (mapping.empty()) return 0;

    std::vector<std::pair<std::string, std::string>> encoded;
    encoded.reserve(mapping.size());
    for (const auto& [field, value] : mapping) encoded.emplace_back(field, codec_.encode(value));

    return run("hset", [&](PgConnection& c) {
        ensure_key(c, key, KeyType::HASH);
        int64_t added = 0;
        for (const auto& [field, bytes] : encoded) {
            // xmax is 0 only on a freshly inserted tuple
            auto res = c.exec(sql("INSERT INTO {hashes} (key, field, value) VALUES ($1, $2, $3) "
                                  "ON CONFLICT (key, field) DO UPDATE SET value = EXCLUDED.value "
                                  "RETURNING (xmax = 0)"),
                              PgParams().text(key).text(field).bytes(bytes));
            if (!res.empty() && res.text(0, 0) == "t") added++;
        }
        return added;
    });
}

bool PostgresBackend::hsetnx(const std::string& key, const std::string& field, const Value& value) {
    std::string bytes = codec_.encode(value);
    return run("hsetnx", [&](PgConnection& c) {
        ensure_key(c, key, KeyType::HASH);
        bool inserted = c.exec(sql("INSERT INTO {hashes} (key, field, value) VALUES ($1, $2, $3) "
                                   "ON CONFLICT (key, field) DO NOTHING"),
                               PgParams().text(key).text(field).bytes(bytes)).affected() > 0;
        return inserted;
    });
}

std::optional<Value> PostgresBackend::hget(const std::string& key, const std::string& field) {
    auto raw = run("hget", [&](PgConnection& c) -> std::optional<std::string> {
        auto res = c.exec(sql(std::string("SELECT value FROM {hashes} WHERE key = $1 AND field = $2") + kLiveKey),
                          PgParams().text(key).text(field));
        if (res.empty()) return std::nullopt;
        return res.bytes(0, 0);
    });
    if (!raw) return std::nullopt;
    return codec_.decode(*raw);
}

std::vector<std::optional<Value>> PostgresBackend::hmget(const std::string& key,
                                                         const std::vector<std::string>& fields) {
    if (fields.empty()) return {};
    auto found = run("hmget", [&](PgConnection& c) {
        PgParams p;
        p.text(key);
        std::string list = bind_list(p, fields, false);
        auto res = c.exec(sql("SELECT field, value FROM {hashes} WHERE key = $1 AND field IN (" + list + ")" +
                              kLiveKey), p);
        std::map<std::string, std::string> out;
        for (int i = 0; i < res.rows(); i++) out.emplace(res.text(i, 0), res.bytes(i, 1));
        return out;
    });

    std::vector<std::optional<Value>> result;
    result.reserve(fields.size());
    for (const auto& f : fields) {
        auto it = found.find(f);
        if (it == found.end()) result.emplace_back(std::nullopt);
        else result.emplace_back(codec_.decode(it->second));
    }
    return result;
}

HashMap PostgresBackend::hgetall(const std::string& key) {
    auto rows = run("hgetall", [&](PgConnection& c) {
        auto res = c.exec(sql(std::string("SELECT field, value FROM {hashes} WHERE key = $1") + kLiveKey),
                          PgParams().text(key));
        std::vector<std::pair<std::string, std::string>> out;
        for (int i = 0; i < res.rows(); i++) out.emplace_back(res.text(i, 0), res.bytes(i, 1));
        return out;
    });
    HashMap result;
    for (const auto& [field, raw] : rows) result.emplace(field, codec_.decode(raw));
    return result;
}

int64_t PostgresBackend::hdel(const std::string& key, const std::vector<std::string>& fields) {
    if (fields.empty()) return 0;
    return run("hdel", [&](PgConnection& c) -> int64_t {
        if (!is_live(c, key, KeyType::HASH)) return 0;
        PgParams p;
        p.text(key);
        std::string list = bind_list(p, fields, false);
        int64_t removed = c.exec(sql("DELETE FROM {hashes} WHERE key = $1 AND field IN (" + list + ")"), p)
                              .affected();
        drop_if_empty(c, key, KeyType::HASH);
        return removed;
    });
}

bool PostgresBackend::hexists(const std::string& key, const std::string& field) {
    return run("hexists", [&](PgConnection& c) {
        return !c.exec(sql(std::string("SELECT 1 FROM {hashes} WHERE key = $1 AND field = $2") + kLiveKey),
                       PgParams().text(key).text(field)).empty();
    });
}

int64_t PostgresBackend::hlen(const std::string& key) {
    return run("hlen", [&](PgConnection& c) {
        return c.exec(sql(std::string("SELECT COUNT(*) FROM {hashes} WHERE key = $1") + kLiveKey),
                      PgParams().text(key)).int64(0, 0);
    });
}

std::vector<std::string> PostgresBackend::hkeys(const std::string& key) {
    return run("hkeys", [&](PgConnection& c) {
        auto res = c.exec(sql(std::string("SELECT field FROM {hashes} WHERE key = $1") + kLiveKey +
                              " ORDER BY field"),
                          PgParams().text(key));
        std::vector<std::string> out;
        out.reserve(res.rows());
        for (int i = 0; i < res.rows(); i++) out.push_back(res.text(i, 0));
        return out;
    });
}

ValueList PostgresBackend::hvals(const std::string& key) {
    auto raws = run("hvals", [&](PgConnection& c) {
        auto res = c.exec(sql(std::string("SELECT value FROM {hashes} WHERE key = $1") + kLiveKey +
                              " ORDER BY field"),
                          PgParams().text(key));
        std::vector<std::string> out;
        out.reserve(res.rows());
        for (int i = 0; i < res.rows(); i++) out.push_back(res.bytes(i, 0));
        return out;
    });
    ValueList result;
    result.reserve(raws.size());
    for (const auto& raw : raws) result.push_back(codec_.decode(raw));
    return result;
}

int64_t PostgresBackend::hincrby(const std::string& key, const std::string& field, int64_t amount) {
    return run("hincrby", [&](PgConnection& c) {
        ensure_key(c, key, KeyType::HASH);
        auto res = c.exec(sql("SELECT value FROM {hashes} WHERE key = $1 AND field = $2 FOR UPDATE"),
                          PgParams().text(key).text(field));
        int64_t current = 0;
        if (!res.empty()) {
            auto n = ValueCodec::parse_int(res.bytes(0, 0));
            if (!n) throw PreconditionError(key, "Hash field '" + field + "' of key '" + key + "' is not an integer");
            current = *n;
        }
        if ((amount > 0 && current > std::numeric_limits<int64_t>::max() - amount) ||
            (amount < 0 && current < std::numeric_limits<int64_t>::min() - amount)) {
            throw PreconditionError(key, "Increment of hash field '" + field + "' of key '" + key + "' would overflow");
        }
        int64_t next = current + amount;
        c.exec(sql("INSERT INTO {hashes} (key, field, value) VALUES ($1, $2, $3) "
                   "ON CONFLICT (key, field) DO UPDATE SET value = EXCLUDED.value"),
               PgParams().text(key).text(field).bytes(std::to_string(next)));
        return next;
    });
}

double PostgresBackend::hincrbyfloat(const std::string& key, const std::string& field, double amount) {
    return run("hincrbyfloat", [&](PgConnection& c) {
        ensure_key(c, key, KeyType::HASH);
        auto res = c.exec(sql("SELECT value FROM {hashes} WHERE key = $1 AND field = $2 FOR UPDATE"),
                          PgParams().text(key).text(field));
        double current = 0.0;
        if (!res.empty()) {
            Value v = codec_.decode(res.bytes(0, 0));
            if (!v.is_number()) {
                throw PreconditionError(key, "Hash field '" + field + "' of key '" + key + "' is not a number");
            }
            current = v.get<double>();
        }
        double next = current + amount;
        if (!std::isfinite(next)) {
            throw PreconditionError(key, "Increment of hash field '" + field + "' would produce NaN or Infinity");
        }
        c.exec(sql("INSERT INTO {hashes} (key, field, value) VALUES ($1, $2, $3) "
                   "ON CONFLICT (key, field) DO UPDATE SET value = EXCLUDED.value"),
               PgParams().text(key).text(field).bytes(codec_.encode(Value(next))));
        return next;
    });
}

} // namespace cachex
