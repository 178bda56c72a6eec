#include "postgres_backend.hpp"
#include <algorithm>
#include <iterator>
#include <set>

namespace cachex {

namespace {

std::vector<std::string> encode_unique(const ValueCodec& codec, const ValueList& members) {
    std::set<std::string> unique;
    for (const auto& m : members) unique.insert(codec.encode(m));
    return {unique.begin(), unique.end()};
}

} // namespace

std::vector<std::string> PostgresBackend::set_members_raw(PgConnection& c, const std::string& key) {
    auto res = c.exec(sql(std::string("SELECT member FROM {sets} WHERE key = $1") + kLiveKey),
                      PgParams().text(key));
    std::vector<std::string> out;
    out.reserve(res.rows());
    for (int i = 0; i < res.rows(); i++) out.push_back(res.bytes(i, 0));
    return out;
}

int64_t PostgresBackend::sadd(const std::string& key, const ValueList& members) {
    if (members.empty()) return 0;
    auto encoded = encode_unique(codec_, members);
    return run("sadd", [&](PgConnection& c) {
        ensure_key(c, key, KeyType::SET);
        PgParams p;
        p.text(key);
        std::string rows;
        for (const auto& m : encoded) {
            if (!rows.empty()) rows += ", ";
            rows += "($1, " + p.next_placeholder() + ")";
            p.bytes(m);
        }
        return c.exec(sql("INSERT INTO {sets} (key, member) VALUES " + rows +
                          " ON CONFLICT (key, member) DO NOTHING"), p).affected();
    });
}

int64_t PostgresBackend::scard(const std::string& key) {
    return run("scard", [&](PgConnection& c) {
        return c.exec(sql(std::string("SELECT COUNT(*) FROM {sets} WHERE key = $1") + kLiveKey),
                      PgParams().text(key)).int64(0, 0);
    });
}

bool PostgresBackend::sismember(const std::string& key, const Value& member) {
    std::string bytes = codec_.encode(member);
    return run("sismember", [&](PgConnection& c) {
        return !c.exec(sql(std::string("SELECT 1 FROM {sets} WHERE key = $1 AND member = $2") + kLiveKey),
                       PgParams().text(key).bytes(bytes)).empty();
    });
}

std::vector<bool> PostgresBackend::smismember(const std::string& key, const ValueList& members) {
    if (members.empty()) return {};
    auto stored = run("smismember", [&](PgConnection& c) {
        auto raw = set_members_raw(c, key);
        return std::set<std::string>(raw.begin(), raw.end());
    });
    std::vector<bool> out;
    out.reserve(members.size());
    for (const auto& m : members) out.push_back(stored.count(codec_.encode(m)) > 0);
    return out;
}

ValueSet PostgresBackend::smembers(const std::string& key) {
    auto raws = run("smembers", [&](PgConnection& c) { return set_members_raw(c, key); });
    ValueSet out;
    for (const auto& raw : raws) out.insert(codec_.decode(raw));
    return out;
}

ValueList PostgresBackend::set_sample(const char* op, const std::string& key, std::optional<int64_t> count,
                                      bool remove) {
    auto picked = run(op, [&](PgConnection& c) {
        std::vector<std::string> members;
        if (remove) {
            if (!is_live(c, key, KeyType::SET)) return members;
            auto res = c.exec(sql("SELECT member FROM {sets} WHERE key = $1 FOR UPDATE"), PgParams().text(key));
            for (int i = 0; i < res.rows(); i++) members.push_back(res.bytes(i, 0));
        } else {
            members = set_members_raw(c, key);
        }
        if (members.empty()) return members;

        std::vector<std::string> out;
        {
            std::lock_guard<std::mutex> lock(rng_mu_);
            if (!count) {
                std::uniform_int_distribution<size_t> dist(0, members.size() - 1);
                out.push_back(members[dist(rng_)]);
            } else if (*count >= 0) {
                size_t n = std::min(static_cast<size_t>(*count), members.size());
                std::sample(members.begin(), members.end(), std::back_inserter(out), n, rng_);
                std::shuffle(out.begin(), out.end(), rng_);
            } else {
                std::uniform_int_distribution<size_t> dist(0, members.size() - 1);
                for (int64_t i = 0; i < -*count; i++) out.push_back(members[dist(rng_)]);
            }
        }

        if (remove && !out.empty()) {
            PgParams p;
            p.text(key);
            std::string list = bind_list(p, out, true);
            c.exec(sql("DELETE FROM {sets} WHERE key = $1 AND member IN (" + list + ")"), p);
            drop_if_empty(c, key, KeyType::SET);
        }
        return out;
    });

    ValueList result;
    result.reserve(picked.size());
    for (const auto& raw : picked) result.push_back(codec_.decode(raw));
    return result;
}

std::optional<Value> PostgresBackend::srandmember(const std::string& key) {
    auto out = set_sample("srandmember", key, std::nullopt, false);
    if (out.empty()) return std::nullopt;
    return std::move(out.front());
}

ValueList PostgresBackend::srandmember(const std::string& key, int64_t count) {
    return set_sample("srandmember", key, count, false);
}

std::optional<Value> PostgresBackend::spop(const std::string& key) {
    auto out = set_sample("spop", key, std::nullopt, true);
    if (out.empty()) return std::nullopt;
    return std::move(out.front());
}

ValueList PostgresBackend::spop(const std::string& key, int64_t count) {
    if (count < 0) throw PreconditionError(key, "spop count must be positive");
    return set_sample("spop", key, count, true);
}

int64_t PostgresBackend::srem(const std::string& key, const ValueList& members) {
    if (members.empty()) return 0;
    auto encoded = encode_unique(codec_, members);
    return run("srem", [&](PgConnection& c) -> int64_t {
        if (!is_live(c, key, KeyType::SET)) return 0;
        PgParams p;
        p.text(key);
        std::string list = bind_list(p, encoded, true);
        int64_t removed = c.exec(sql("DELETE FROM {sets} WHERE key = $1 AND member IN (" + list + ")"), p)
                              .affected();
        drop_if_empty(c, key, KeyType::SET);
        return removed;
    });
}

bool PostgresBackend::smove(const std::string& src, const std::string& dst, const Value& member) {
    std::string bytes = codec_.encode(member);
    return run("smove", [&](PgConnection& c) {
        if (!is_live(c, src, KeyType::SET)) return false;
        bool moved = c.exec(sql("DELETE FROM {sets} WHERE key = $1 AND member = $2"),
                            PgParams().text(src).bytes(bytes)).affected() > 0;
        if (!moved) return false;

        ensure_key(c, dst, KeyType::SET);
        c.exec(sql("INSERT INTO {sets} (key, member) VALUES ($1, $2) ON CONFLICT (key, member) DO NOTHING"),
               PgParams().text(dst).bytes(bytes));
        drop_if_empty(c, src, KeyType::SET);
        return true;
    });
}

std::vector<std::string> PostgresBackend::set_algebra(PgConnection& c, const std::vector<std::string>& keys,
                                                      SetOp op) {
    if (keys.empty()) return {};

    auto first = set_members_raw(c, keys.front());
    std::set<std::string> acc(first.begin(), first.end());
    for (size_t i = 1; i < keys.size(); i++) {
        if (op != SetOp::UNION && acc.empty()) break;
        auto raw = set_members_raw(c, keys[i]);
        std::set<std::string> other(raw.begin(), raw.end());
        std::set<std::string> next;
        switch (op) {
            case SetOp::DIFF:
                std::set_difference(acc.begin(), acc.end(), other.begin(), other.end(),
                                    std::inserter(next, next.end()));
                break;
            case SetOp::INTER:
                std::set_intersection(acc.begin(), acc.end(), other.begin(), other.end(),
                                      std::inserter(next, next.end()));
                break;
            case SetOp::UNION:
                std::set_union(acc.begin(), acc.end(), other.begin(), other.end(),
                               std::inserter(next, next.end()));
                break;
        }
        acc.swap(next);
    }
    return {acc.begin(), acc.end()};
}

int64_t PostgresBackend::set_store(const char* op, const std::string& dest, const std::vector<std::string>& keys,
                                   SetOp sop) {
    return run(op, [&](PgConnection& c) {
        // Computed before dest is cleared; dest may be one of the inputs
        auto result = set_algebra(c, keys, sop);
        delete_key(c, dest);
        if (result.empty()) return int64_t{0};

        c.exec(sql("INSERT INTO {main} (key, type) VALUES ($1, $2)"),
               PgParams().text(dest).text(type_id(KeyType::SET)));
        PgParams p;
        p.text(dest);
        std::string rows;
        for (const auto& m : result) {
            if (!rows.empty()) rows += ", ";
            rows += "($1, " + p.next_placeholder() + ")";
            p.bytes(m);
        }
        c.exec(sql("INSERT INTO {sets} (key, member) VALUES " + rows), p);
        return static_cast<int64_t>(result.size());
    });
}

namespace {

ValueSet decode_set(const ValueCodec& codec, const std::vector<std::string>& raws) {
    ValueSet out;
    for (const auto& raw : raws) out.insert(codec.decode(raw));
    return out;
}

} // namespace

ValueSet PostgresBackend::sdiff(const std::vector<std::string>& keys) {
    return decode_set(codec_, run("sdiff", [&](PgConnection& c) { return set_algebra(c, keys, SetOp::DIFF); }));
}

ValueSet PostgresBackend::sinter(const std::vector<std::string>& keys) {
    return decode_set(codec_, run("sinter", [&](PgConnection& c) { return set_algebra(c, keys, SetOp::INTER); }));
}

ValueSet PostgresBackend::sunion(const std::vector<std::string>& keys) {
    return decode_set(codec_, run("sunion", [&](PgConnection& c) { return set_algebra(c, keys, SetOp::UNION); }));
}

int64_t PostgresBackend::sdiffstore(const std::string& dest, const std::vector<std::string>& keys) {
    return set_store("sdiffstore", dest, keys, SetOp::DIFF);
}

int64_t PostgresBackend::sinterstore(const std::string& dest, const std::vector<std::string>& keys) {
    return set_store("sinterstore", dest, keys, SetOp::INTER);
}

int64_t PostgresBackend::sunionstore(const std::string& dest, const std::vector<std::string>& keys) {
    return set_store("sunionstore", dest, keys, SetOp::UNION);
}

} // namespace cachex
