#include "postgres_backend.hpp"
#include <cmath>
#include "list_index.hpp"
#include "zset_rules.hpp"

namespace cachex {

namespace {

// Rank order; ties on score fall back to the encoded member bytes
const char* kAscending = " ORDER BY score ASC, member ASC";
const char* kDescending = " ORDER BY score DESC, member DESC";

} // namespace

std::vector<ScoredMember> PostgresBackend::zset_rows(PgResult& res) {
    std::vector<ScoredMember> out;
    out.reserve(res.rows());
    for (int i = 0; i < res.rows(); i++) {
        out.push_back({codec_.decode(res.bytes(i, 0)), res.dbl(i, 1)});
    }
    return out;
}

int64_t PostgresBackend::zadd(const std::string& key, const std::vector<ScoredMember>& members, ZAddFlags flags) {
    if (members.empty()) return 0;
    for (const auto& sm : members) {
        if (std::isnan(sm.score)) throw PreconditionError(key, "zadd score is not a valid float");
    }

    std::vector<std::pair<std::string, double>> encoded;
    encoded.reserve(members.size());
    for (const auto& sm : members) encoded.emplace_back(codec_.encode(sm.member), sm.score);

    return run("zadd", [&](PgConnection& c) {
        ensure_key(c, key, KeyType::ZSET);
        int64_t counted = 0;
        for (const auto& [member, score] : encoded) {
            auto res = c.exec(sql("SELECT score FROM {zsets} WHERE key = $1 AND member = $2 FOR UPDATE"),
                              PgParams().text(key).bytes(member));
            std::optional<double> current;
            if (!res.empty()) current = res.dbl(0, 0);

            ZAddDecision d = decide_zadd(current, score, flags);
            if (d.action == ZAddAction::INSERT) {
                c.exec(sql("INSERT INTO {zsets} (key, member, score) VALUES ($1, $2, $3)"),
                       PgParams().text(key).bytes(member).dbl(score));
            } else if (d.action == ZAddAction::UPDATE) {
                c.exec(sql("UPDATE {zsets} SET score = $3 WHERE key = $1 AND member = $2"),
                       PgParams().text(key).bytes(member).dbl(score));
            }
            if (d.counted) counted++;
        }
        // xx against a missing key must not leave an empty registry row behind
        drop_if_empty(c, key, KeyType::ZSET);
        return counted;
    });
}

int64_t PostgresBackend::zcard(const std::string& key) {
    return run("zcard", [&](PgConnection& c) {
        return c.exec(sql(std::string("SELECT COUNT(*) FROM {zsets} WHERE key = $1") + kLiveKey),
                      PgParams().text(key)).int64(0, 0);
    });
}

int64_t PostgresBackend::zcount(const std::string& key, const ScoreBound& min, const ScoreBound& max) {
    return run("zcount", [&](PgConnection& c) {
        return c.exec(sql(std::string("SELECT COUNT(*) FROM {zsets} WHERE key = $1 AND score ") +
                          min.lower_op() + " $2 AND score " + max.upper_op() + " $3" + kLiveKey),
                      PgParams().text(key).dbl(min.value).dbl(max.value)).int64(0, 0);
    });
}

double PostgresBackend::zincrby(const std::string& key, double amount, const Value& member) {
    std::string bytes = codec_.encode(member);
    return run("zincrby", [&](PgConnection& c) {
        ensure_key(c, key, KeyType::ZSET);
        auto res = c.exec(sql("SELECT score FROM {zsets} WHERE key = $1 AND member = $2 FOR UPDATE"),
                          PgParams().text(key).bytes(bytes));
        double next = (res.empty() ? 0.0 : res.dbl(0, 0)) + amount;
        if (std::isnan(next)) throw PreconditionError(key, "zincrby resulted in NaN");
        c.exec(sql("INSERT INTO {zsets} (key, member, score) VALUES ($1, $2, $3) "
                   "ON CONFLICT (key, member) DO UPDATE SET score = EXCLUDED.score"),
               PgParams().text(key).bytes(bytes).dbl(next));
        return next;
    });
}

std::vector<ScoredMember> PostgresBackend::zset_pop(const char* op, const std::string& key, int64_t count,
                                                    bool max) {
    if (count < 0) throw PreconditionError(key, std::string(op) + " count must be positive");
    if (count == 0) return {};
    return run(op, [&](PgConnection& c) {
        std::vector<ScoredMember> out;
        if (!is_live(c, key, KeyType::ZSET)) return out;

        auto res = c.exec(sql(std::string("SELECT member, score FROM {zsets} WHERE key = $1") +
                              (max ? kDescending : kAscending) + " LIMIT $2 FOR UPDATE"),
                          PgParams().text(key).int64(count));
        if (res.empty()) return out;

        std::vector<std::string> members;
        for (int i = 0; i < res.rows(); i++) members.push_back(res.bytes(i, 0));
        out = zset_rows(res);

        PgParams p;
        p.text(key);
        std::string list = bind_list(p, members, true);
        c.exec(sql("DELETE FROM {zsets} WHERE key = $1 AND member IN (" + list + ")"), p);
        drop_if_empty(c, key, KeyType::ZSET);
        return out;
    });
}

std::vector<ScoredMember> PostgresBackend::zpopmin(const std::string& key, int64_t count) {
    return zset_pop("zpopmin", key, count, false);
}

std::vector<ScoredMember> PostgresBackend::zpopmax(const std::string& key, int64_t count) {
    return zset_pop("zpopmax", key, count, true);
}

std::vector<ScoredMember> PostgresBackend::zset_range_by_rank(const char* op, const std::string& key,
                                                              int64_t start, int64_t end, bool reverse) {
    return run(op, [&](PgConnection& c) {
        std::vector<ScoredMember> out;
        int64_t n = c.exec(sql(std::string("SELECT COUNT(*) FROM {zsets} WHERE key = $1") + kLiveKey),
                           PgParams().text(key)).int64(0, 0);
        auto window = normalize_range(start, end, static_cast<size_t>(n));
        if (!window) return out;

        int64_t offset = static_cast<int64_t>(window->first);
        int64_t limit = static_cast<int64_t>(window->second - window->first + 1);
        auto res = c.exec(sql(std::string("SELECT member, score FROM {zsets} WHERE key = $1") + kLiveKey +
                              (reverse ? kDescending : kAscending) + " LIMIT $2 OFFSET $3"),
                          PgParams().text(key).int64(limit).int64(offset));
        return zset_rows(res);
    });
}

std::vector<ScoredMember> PostgresBackend::zrange_withscores(const std::string& key, int64_t start, int64_t end) {
    return zset_range_by_rank("zrange", key, start, end, false);
}

std::vector<ScoredMember> PostgresBackend::zrevrange_withscores(const std::string& key, int64_t start,
                                                                int64_t end) {
    return zset_range_by_rank("zrevrange", key, start, end, true);
}

std::vector<ScoredMember> PostgresBackend::zset_range_by_score(const char* op, const std::string& key,
                                                               const ScoreBound& min, const ScoreBound& max,
                                                               std::optional<RangeLimit> limit, bool reverse) {
    PgParams p;
    p.text(key).dbl(min.value).dbl(max.value);
    std::string q = std::string("SELECT member, score FROM {zsets} WHERE key = $1 AND score ") +
                    min.lower_op() + " $2 AND score " + max.upper_op() + " $3" + kLiveKey +
                    (reverse ? kDescending : kAscending);
    if (limit) {
        // A negative count returns everything past the offset
        if (limit->count >= 0) {
            q += " LIMIT " + p.next_placeholder();
            p.int64(limit->count);
        }
        q += " OFFSET " + p.next_placeholder();
        p.int64(std::max<int64_t>(limit->offset, 0));
    }
    return run(op, [&](PgConnection& c) {
        auto res = c.exec(sql(q), p);
        return zset_rows(res);
    });
}

std::vector<ScoredMember> PostgresBackend::zrangebyscore_withscores(
    const std::string& key, const ScoreBound& min, const ScoreBound& max, std::optional<RangeLimit> limit) {
    return zset_range_by_score("zrangebyscore", key, min, max, limit, false);
}

std::vector<ScoredMember> PostgresBackend::zrevrangebyscore_withscores(
    const std::string& key, const ScoreBound& max, const ScoreBound& min, std::optional<RangeLimit> limit) {
    return zset_range_by_score("zrevrangebyscore", key, min, max, limit, true);
}

std::optional<int64_t> PostgresBackend::zset_rank(const char* op, const std::string& key, const Value& member,
                                                  bool reverse) {
    std::string bytes = codec_.encode(member);
    return run(op, [&](PgConnection& c) -> std::optional<int64_t> {
        auto res = c.exec(sql(std::string("SELECT score FROM {zsets} WHERE key = $1 AND member = $2") + kLiveKey),
                          PgParams().text(key).bytes(bytes));
        if (res.empty()) return std::nullopt;
        double score = res.dbl(0, 0);

        const char* before = reverse
            ? "SELECT COUNT(*) FROM {zsets} WHERE key = $1 AND (score > $3 OR (score = $3 AND member > $2))"
            : "SELECT COUNT(*) FROM {zsets} WHERE key = $1 AND (score < $3 OR (score = $3 AND member < $2))";
        return c.exec(sql(before), PgParams().text(key).bytes(bytes).dbl(score)).int64(0, 0);
    });
}

std::optional<int64_t> PostgresBackend::zrank(const std::string& key, const Value& member) {
    return zset_rank("zrank", key, member, false);
}

std::optional<int64_t> PostgresBackend::zrevrank(const std::string& key, const Value& member) {
    return zset_rank("zrevrank", key, member, true);
}

int64_t PostgresBackend::zrem(const std::string& key, const ValueList& members) {
    if (members.empty()) return 0;
    std::vector<std::string> encoded;
    encoded.reserve(members.size());
    for (const auto& m : members) encoded.push_back(codec_.encode(m));

    return run("zrem", [&](PgConnection& c) -> int64_t {
        if (!is_live(c, key, KeyType::ZSET)) return 0;
        PgParams p;
        p.text(key);
        std::string list = bind_list(p, encoded, true);
        int64_t removed = c.exec(sql("DELETE FROM {zsets} WHERE key = $1 AND member IN (" + list + ")"), p)
                              .affected();
        drop_if_empty(c, key, KeyType::ZSET);
        return removed;
    });
}

int64_t PostgresBackend::zremrangebyscore(const std::string& key, const ScoreBound& min, const ScoreBound& max) {
    return run("zremrangebyscore", [&](PgConnection& c) -> int64_t {
        if (!is_live(c, key, KeyType::ZSET)) return 0;
        int64_t removed = c.exec(sql(std::string("DELETE FROM {zsets} WHERE key = $1 AND score ") +
                                     min.lower_op() + " $2 AND score " + max.upper_op() + " $3"),
                                 PgParams().text(key).dbl(min.value).dbl(max.value)).affected();
        drop_if_empty(c, key, KeyType::ZSET);
        return removed;
    });
}

int64_t PostgresBackend::zremrangebyrank(const std::string& key, int64_t start, int64_t end) {
    return run("zremrangebyrank", [&](PgConnection& c) -> int64_t {
        if (!is_live(c, key, KeyType::ZSET)) return 0;
        int64_t n = c.exec(sql("SELECT COUNT(*) FROM {zsets} WHERE key = $1"), PgParams().text(key)).int64(0, 0);
        auto window = normalize_range(start, end, static_cast<size_t>(n));
        if (!window) return 0;

        int64_t offset = static_cast<int64_t>(window->first);
        int64_t limit = static_cast<int64_t>(window->second - window->first + 1);
        auto res = c.exec(sql(std::string("SELECT member FROM {zsets} WHERE key = $1") + kAscending +
                              " LIMIT $2 OFFSET $3 FOR UPDATE"),
                          PgParams().text(key).int64(limit).int64(offset));
        std::vector<std::string> members;
        for (int i = 0; i < res.rows(); i++) members.push_back(res.bytes(i, 0));
        if (members.empty()) return 0;

        PgParams p;
        p.text(key);
        std::string list = bind_list(p, members, true);
        int64_t removed = c.exec(sql("DELETE FROM {zsets} WHERE key = $1 AND member IN (" + list + ")"), p)
                              .affected();
        drop_if_empty(c, key, KeyType::ZSET);
        return removed;
    });
}

std::optional<double> PostgresBackend::zscore(const std::string& key, const Value& member) {
    std::string bytes = codec_.encode(member);
    return run("zscore", [&](PgConnection& c) -> std::optional<double> {
        auto res = c.exec(sql(std::string("SELECT score FROM {zsets} WHERE key = $1 AND member = $2") + kLiveKey),
                          PgParams().text(key).bytes(bytes));
        if (res.empty()) return std::nullopt;
        return res.dbl(0, 0);
    });
}

std::vector<std::optional<double>> PostgresBackend::zmscore(const std::string& key, const ValueList& members) {
    if (members.empty()) return {};
    std::vector<std::string> encoded;
    encoded.reserve(members.size());
    for (const auto& m : members) encoded.push_back(codec_.encode(m));

    auto scores = run("zmscore", [&](PgConnection& c) {
        PgParams p;
        p.text(key);
        std::string list = bind_list(p, encoded, true);
        auto res = c.exec(sql("SELECT member, score FROM {zsets} WHERE key = $1 AND member IN (" + list + ")" +
                              kLiveKey), p);
        std::map<std::string, double> out;
        for (int i = 0; i < res.rows(); i++) out.emplace(res.bytes(i, 0), res.dbl(i, 1));
        return out;
    });

    std::vector<std::optional<double>> result;
    result.reserve(encoded.size());
    for (const auto& m : encoded) {
        auto it = scores.find(m);
        if (it == scores.end()) result.emplace_back(std::nullopt);
        else result.emplace_back(it->second);
    }
    return result;
}

} // namespace cachex
