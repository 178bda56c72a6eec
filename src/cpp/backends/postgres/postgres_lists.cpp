#include "postgres_backend.hpp"
#include "list_index.hpp"
#include <limits>

namespace cachex {

// Positions are sparse BIGINTs: lpush goes below the minimum, rpush above the
// maximum and linsert takes the midpoint of its neighbours when there is room.

std::vector<int64_t> PostgresBackend::list_positions(PgConnection& c, const std::string& key) {
    auto res = c.exec(sql(std::string("SELECT pos FROM {lists} WHERE key = $1") + kLiveKey + " ORDER BY pos"),
                      PgParams().text(key));
    std::vector<int64_t> out;
    out.reserve(res.rows());
    for (int i = 0; i < res.rows(); i++) out.push_back(res.int64(i, 0));
    return out;
}

int64_t PostgresBackend::list_len(PgConnection& c, const std::string& key) {
    return c.exec(sql(std::string("SELECT COUNT(*) FROM {lists} WHERE key = $1") + kLiveKey),
                  PgParams().text(key)).int64(0, 0);
}

void PostgresBackend::list_append(PgConnection& c, const std::string& key, const std::string& bytes,
                                  ListEnd end) {
    const char* tmpl = end == ListEnd::LEFT
        ? "INSERT INTO {lists} (key, pos, value) "
          "SELECT $1, COALESCE(MIN(pos) - 1, 0), $2 FROM {lists} WHERE key = $1"
        : "INSERT INTO {lists} (key, pos, value) "
          "SELECT $1, COALESCE(MAX(pos) + 1, 0), $2 FROM {lists} WHERE key = $1";
    c.exec(sql(tmpl), PgParams().text(key).bytes(bytes));
}

std::vector<std::string> PostgresBackend::list_take(PgConnection& c, const std::string& key, int64_t count,
                                                    ListEnd end) {
    std::vector<std::string> out;
    if (count <= 0 || !is_live(c, key, KeyType::LIST)) return out;

    std::string order = end == ListEnd::LEFT ? "ASC" : "DESC";
    auto res = c.exec(sql("SELECT pos, value FROM {lists} WHERE key = $1 ORDER BY pos " + order +
                          " LIMIT $2 FOR UPDATE"),
                      PgParams().text(key).int64(count));
    if (res.empty()) return out;

    std::vector<std::string> positions;
    for (int i = 0; i < res.rows(); i++) {
        positions.push_back(res.text(i, 0));
        out.push_back(res.bytes(i, 1));
    }
    PgParams p;
    p.text(key);
    std::string list = bind_list(p, positions, false);
    c.exec(sql("DELETE FROM {lists} WHERE key = $1 AND pos IN (" + list + ")"), p);
    return out;
}

int64_t PostgresBackend::list_push(const char* op, const std::string& key, const ValueList& values,
                                   ListEnd end) {
    std::vector<std::string> encoded;
    encoded.reserve(values.size());
    for (const auto& v : values) encoded.push_back(codec_.encode(v));

    return run(op, [&](PgConnection& c) {
        ensure_key(c, key, KeyType::LIST);
        for (const auto& bytes : encoded) list_append(c, key, bytes, end);
        return c.exec(sql("SELECT COUNT(*) FROM {lists} WHERE key = $1"), PgParams().text(key)).int64(0, 0);
    });
}

ValueList PostgresBackend::list_pop(const char* op, const std::string& key, int64_t count, ListEnd end) {
    if (count < 0) throw PreconditionError(key, std::string(op) + " count must be positive");
    auto raws = run(op, [&](PgConnection& c) {
        auto taken = list_take(c, key, count, end);
        if (!taken.empty()) drop_if_empty(c, key, KeyType::LIST);
        return taken;
    });
    ValueList out;
    out.reserve(raws.size());
    for (const auto& raw : raws) out.push_back(codec_.decode(raw));
    return out;
}

int64_t PostgresBackend::lpush(const std::string& key, const ValueList& values) {
    if (values.empty()) return llen(key);
    return list_push("lpush", key, values, ListEnd::LEFT);
}

int64_t PostgresBackend::rpush(const std::string& key, const ValueList& values) {
    if (values.empty()) return llen(key);
    return list_push("rpush", key, values, ListEnd::RIGHT);
}

std::optional<Value> PostgresBackend::lpop(const std::string& key) {
    auto out = list_pop("lpop", key, 1, ListEnd::LEFT);
    if (out.empty()) return std::nullopt;
    return std::move(out.front());
}

ValueList PostgresBackend::lpop(const std::string& key, int64_t count) {
    return list_pop("lpop", key, count, ListEnd::LEFT);
}

std::optional<Value> PostgresBackend::rpop(const std::string& key) {
    auto out = list_pop("rpop", key, 1, ListEnd::RIGHT);
    if (out.empty()) return std::nullopt;
    return std::move(out.front());
}

ValueList PostgresBackend::rpop(const std::string& key, int64_t count) {
    return list_pop("rpop", key, count, ListEnd::RIGHT);
}

ValueList PostgresBackend::lrange(const std::string& key, int64_t start, int64_t end) {
    auto raws = run("lrange", [&](PgConnection& c) {
        std::vector<std::string> out;
        auto window = normalize_range(start, end, static_cast<size_t>(list_len(c, key)));
        if (!window) return out;

        int64_t offset = static_cast<int64_t>(window->first);
        int64_t limit = static_cast<int64_t>(window->second - window->first + 1);
        auto res = c.exec(sql(std::string("SELECT value FROM {lists} WHERE key = $1") + kLiveKey +
                              " ORDER BY pos LIMIT $2 OFFSET $3"),
                          PgParams().text(key).int64(limit).int64(offset));
        out.reserve(res.rows());
        for (int i = 0; i < res.rows(); i++) out.push_back(res.bytes(i, 0));
        return out;
    });
    ValueList result;
    result.reserve(raws.size());
    for (const auto& raw : raws) result.push_back(codec_.decode(raw));
    return result;
}

std::optional<Value> PostgresBackend::lindex(const std::string& key, int64_t index) {
    auto raw = run("lindex", [&](PgConnection& c) -> std::optional<std::string> {
        auto i = resolve_list_index(index, static_cast<size_t>(list_len(c, key)));
        if (!i) return std::nullopt;
        auto res = c.exec(sql(std::string("SELECT value FROM {lists} WHERE key = $1") + kLiveKey +
                              " ORDER BY pos LIMIT 1 OFFSET $2"),
                          PgParams().text(key).int64(static_cast<int64_t>(*i)));
        if (res.empty()) return std::nullopt;
        return res.bytes(0, 0);
    });
    if (!raw) return std::nullopt;
    return codec_.decode(*raw);
}

int64_t PostgresBackend::llen(const std::string& key) {
    return run("llen", [&](PgConnection& c) { return list_len(c, key); });
}

std::optional<int64_t> PostgresBackend::lpos(const std::string& key, const Value& value,
                                             const LposOptions& opts) {
    auto found = lpos_count(key, value, 1, opts);
    if (found.empty()) return std::nullopt;
    return found.front();
}

std::vector<int64_t> PostgresBackend::lpos_count(const std::string& key, const Value& value,
                                                 int64_t count, const LposOptions& opts) {
    if (count < 0) throw PreconditionError(key, "lpos count can't be negative");
    if (opts.maxlen && *opts.maxlen < 0) throw PreconditionError(key, "lpos maxlen can't be negative");
    if (opts.rank && *opts.rank == std::numeric_limits<int64_t>::min()) {
        throw PreconditionError(key, "lpos rank is out of range");
    }

    std::string needle = codec_.encode(value);
    auto is_match = run("lpos", [&](PgConnection& c) {
        auto res = c.exec(sql(std::string("SELECT value FROM {lists} WHERE key = $1") + kLiveKey +
                              " ORDER BY pos"),
                          PgParams().text(key));
        std::vector<bool> out(static_cast<size_t>(res.rows()));
        for (int i = 0; i < res.rows(); i++) out[static_cast<size_t>(i)] = res.bytes(i, 0) == needle;
        return out;
    });
    return lpos_select(is_match, opts, count);
}

std::optional<Value> PostgresBackend::lmove(const std::string& src, const std::string& dst,
                                            ListEnd wherefrom, ListEnd whereto) {
    auto raw = run("lmove", [&](PgConnection& c) -> std::optional<std::string> {
        auto taken = list_take(c, src, 1, wherefrom);
        if (taken.empty()) return std::nullopt;

        ensure_key(c, dst, KeyType::LIST);
        list_append(c, dst, taken.front(), whereto);
        if (src != dst) drop_if_empty(c, src, KeyType::LIST);
        return taken.front();
    });
    if (!raw) return std::nullopt;
    LOG_DBG("[postgresql] lmove %s %s -> %s %s", src.c_str(), list_end_str(wherefrom),
        dst.c_str(), list_end_str(whereto));
    return codec_.decode(*raw);
}

int64_t PostgresBackend::lrem(const std::string& key, int64_t count, const Value& value) {
    std::string needle = codec_.encode(value);
    return run("lrem", [&](PgConnection& c) -> int64_t {
        if (!is_live(c, key, KeyType::LIST)) return 0;
        auto res = c.exec(sql("SELECT pos, value FROM {lists} WHERE key = $1 ORDER BY pos FOR UPDATE"),
                          PgParams().text(key));

        std::vector<std::string> matches;
        for (int i = 0; i < res.rows(); i++) {
            if (res.bytes(i, 1) == needle) matches.push_back(res.text(i, 0));
        }
        if (count > 0 && static_cast<int64_t>(matches.size()) > count) {
            matches.resize(static_cast<size_t>(count));
        } else if (count < 0 && static_cast<int64_t>(matches.size()) > -count) {
            matches.erase(matches.begin(), matches.end() + count);
        }
        if (matches.empty()) return 0;

        PgParams p;
        p.text(key);
        std::string list = bind_list(p, matches, false);
        int64_t removed = c.exec(sql("DELETE FROM {lists} WHERE key = $1 AND pos IN (" + list + ")"), p)
                              .affected();
        drop_if_empty(c, key, KeyType::LIST);
        return removed;
    });
}

void PostgresBackend::ltrim(const std::string& key, int64_t start, int64_t end) {
    run("ltrim", [&](PgConnection& c) {
        auto positions = list_positions(c, key);
        if (positions.empty()) return;

        auto window = normalize_range(start, end, positions.size());
        if (!window) {
            c.exec(sql("DELETE FROM {lists} WHERE key = $1"), PgParams().text(key));
        } else {
            c.exec(sql("DELETE FROM {lists} WHERE key = $1 AND (pos < $2 OR pos > $3)"),
                   PgParams().text(key).int64(positions[window->first]).int64(positions[window->second]));
        }
        drop_if_empty(c, key, KeyType::LIST);
    });
}

void PostgresBackend::lset(const std::string& key, int64_t index, const Value& value) {
    std::string bytes = codec_.encode(value);
    run("lset", [&](PgConnection& c) {
        auto positions = list_positions(c, key);
        auto i = resolve_list_index(index, positions.size());
        if (!i) throw IndexOutOfRangeError(key, index);
        c.exec(sql("UPDATE {lists} SET value = $3 WHERE key = $1 AND pos = $2"),
               PgParams().text(key).int64(positions[*i]).bytes(bytes));
    });
}

int64_t PostgresBackend::linsert(const std::string& key, InsertWhere where,
                                 const Value& pivot, const Value& value) {
    std::string needle = codec_.encode(pivot);
    std::string bytes = codec_.encode(value);
    return run("linsert", [&](PgConnection& c) -> int64_t {
        if (!is_live(c, key, KeyType::LIST)) return 0;
        auto res = c.exec(sql("SELECT pos, value FROM {lists} WHERE key = $1 ORDER BY pos FOR UPDATE"),
                          PgParams().text(key));

        const size_t n = static_cast<size_t>(res.rows());
        std::vector<int64_t> positions(n);
        std::optional<size_t> found;
        for (size_t i = 0; i < n; i++) {
            positions[i] = res.int64(static_cast<int>(i), 0);
            if (!found && res.bytes(static_cast<int>(i), 1) == needle) found = i;
        }
        if (!found) return -1;

        // Insert so the new element lands at logical index k
        size_t k = where == InsertWhere::BEFORE ? *found : *found + 1;
        int64_t pos;
        if (k == 0) {
            pos = positions.front() - 1;
        } else if (k == n) {
            pos = positions.back() + 1;
        } else if (positions[k] - positions[k - 1] > 1) {
            pos = positions[k - 1] + (positions[k] - positions[k - 1]) / 2;
        } else {
            // No gap: move [positions[k], max] up by one. The primary key is
            // checked per row, so park the block above max first.
            int64_t hi = positions[k];
            int64_t max = positions.back();
            int64_t park = max - hi + 2;
            c.exec(sql("UPDATE {lists} SET pos = pos + $2 WHERE key = $1 AND pos >= $3"),
                   PgParams().text(key).int64(park).int64(hi));
            c.exec(sql("UPDATE {lists} SET pos = pos - $2 WHERE key = $1 AND pos > $3"),
                   PgParams().text(key).int64(park - 1).int64(max));
            pos = hi;
        }

        c.exec(sql("INSERT INTO {lists} (key, pos, value) VALUES ($1, $2, $3)"),
               PgParams().text(key).int64(pos).bytes(bytes));
        return static_cast<int64_t>(n) + 1;
    });
}

} // namespace cachex
