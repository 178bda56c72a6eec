#pragma once
// Value and argument types shared by every backend
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>
#include "errors.hpp"

namespace cachex {

// Cached values keep their JSON kind: int, bool, float, string, object, array.
using Value = nlohmann::json;

// Relative timeout in seconds. nullopt = never expires, 0 = delete now.
using Timeout = std::optional<double>;

// ttl/pttl/expiretime result for a key that does not exist
constexpr int64_t kKeyAbsent = -2;

// Key type tags; the numeric values are persisted in the registry table.
enum class KeyType : int { STRING = 0, HASH = 1, LIST = 2, SET = 3, ZSET = 4 };

inline const char* key_type_str(KeyType t) {
    switch (t) {
        case KeyType::STRING: return "string";
        case KeyType::HASH:   return "hash";
        case KeyType::LIST:   return "list";
        case KeyType::SET:    return "set";
        case KeyType::ZSET:   return "zset";
    }
    return "??";
}

inline std::optional<KeyType> parse_key_type(std::string_view s) {
    if (s == "string") return KeyType::STRING;
    if (s == "hash") return KeyType::HASH;
    if (s == "list") return KeyType::LIST;
    if (s == "set") return KeyType::SET;
    if (s == "zset") return KeyType::ZSET;
    return std::nullopt;
}

struct ScanResult {
    int64_t next_cursor = 0;    // 0 once the key space is exhausted
    std::vector<std::string> keys;
};

struct SetFlags {
    bool nx = false;    // only if absent
    bool xx = false;    // only if present
    bool get = false;   // return the previous string value
};

struct SetResult {
    bool applied = false;
    std::optional<Value> previous;  // filled only when SetFlags::get was set
};

enum class ListEnd { LEFT, RIGHT };
enum class InsertWhere { BEFORE, AFTER };

inline const char* list_end_str(ListEnd e) { return e == ListEnd::LEFT ? "LEFT" : "RIGHT"; }

struct LposOptions {
    std::optional<int64_t> rank;    // negative = search from the tail
    std::optional<int64_t> maxlen;  // compare at most this many elements
};

// Redis score bound: "-inf", "+inf"/"inf", "(1.5" (exclusive) or a number.
struct ScoreBound {
    double value = 0.0;
    bool inclusive = true;

    ScoreBound() = default;
    ScoreBound(double v, bool incl = true) : value(v), inclusive(incl) {}
    ScoreBound(const char* s) : ScoreBound(parse(s)) {}
    ScoreBound(const std::string& s) : ScoreBound(parse(s)) {}

    static ScoreBound parse(std::string_view text) {
        while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) text.remove_prefix(1);
        while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.remove_suffix(1);

        if (text == "-inf") return {-std::numeric_limits<double>::infinity(), true};
        if (text == "+inf" || text == "inf") return {std::numeric_limits<double>::infinity(), true};

        bool inclusive = true;
        if (!text.empty() && text.front() == '(') {
            inclusive = false;
            text.remove_prefix(1);
        }
        std::string buf(text);
        char* end = nullptr;
        double v = std::strtod(buf.c_str(), &end);
        if (buf.empty() || end != buf.c_str() + buf.size()) {
            throw CacheError("invalid score bound '" + std::string(text) + "'");
        }
        return {v, inclusive};
    }

    [[nodiscard]] const char* lower_op() const { return inclusive ? ">=" : ">"; }
    [[nodiscard]] const char* upper_op() const { return inclusive ? "<=" : "<"; }
};

struct ZAddFlags {
    bool nx = false;
    bool xx = false;
    bool gt = false;
    bool lt = false;
    bool ch = false;    // count changed scores as well as new members
};

struct ScoredMember {
    Value member;
    double score = 0.0;

    bool operator==(const ScoredMember& o) const { return member == o.member && score == o.score; }
};

// LIMIT/OFFSET window for zrangebyscore
struct RangeLimit {
    int64_t offset = 0;
    int64_t count = 0;
};

using ValueList = std::vector<Value>;
using HashMap = std::map<std::string, Value>;
using ValueSet = std::set<Value>;

} // namespace cachex
