#pragma once
// Redis list index arithmetic over the dense logical order of a list.
// Stored positions are sparse; callers fetch them in order and map through
// these helpers.
#include <algorithm>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>
#include "../../types.hpp"

namespace cachex {

// Negative indices count from the tail. nullopt when out of range.
inline std::optional<size_t> resolve_list_index(int64_t index, size_t length) {
    int64_t n = static_cast<int64_t>(length);
    if (index < 0) index += n;
    if (index < 0 || index >= n) return std::nullopt;
    return static_cast<size_t>(index);
}

// Inclusive [start, end] clamped to the list; nullopt when the window is empty.
inline std::optional<std::pair<size_t, size_t>> normalize_range(int64_t start, int64_t end, size_t length) {
    if (length == 0) return std::nullopt;
    int64_t n = static_cast<int64_t>(length);
    if (start < 0) start += n;
    if (end < 0) end += n;
    start = std::max<int64_t>(start, 0);
    end = std::min<int64_t>(end, n - 1);
    if (start > end) return std::nullopt;
    return std::make_pair(static_cast<size_t>(start), static_cast<size_t>(end));
}

// LPOS selection. is_match[i] says whether element i equals the needle.
// A negative rank scans from the tail (maxlen then counts from the tail too)
// and reports matches tail-first. limit 0 means every match.
inline std::vector<int64_t> lpos_select(const std::vector<bool>& is_match, const LposOptions& opts,
                                        int64_t limit) {
    int64_t rank = opts.rank.value_or(1);
    if (rank == 0) rank = 1;
    const bool reverse = rank < 0;
    int64_t skip = reverse ? -(rank + 1) : rank - 1;

    const int64_t n = static_cast<int64_t>(is_match.size());
    int64_t scan = n;
    if (opts.maxlen && *opts.maxlen > 0) scan = std::min(scan, *opts.maxlen);

    std::vector<int64_t> found;
    for (int64_t step = 0; step < scan; step++) {
        int64_t i = reverse ? n - 1 - step : step;
        if (!is_match[static_cast<size_t>(i)]) continue;
        if (skip > 0) {
            skip--;
            continue;
        }
        found.push_back(i);
        if (limit > 0 && static_cast<int64_t>(found.size()) >= limit) break;
    }
    return found;
}

} // namespace cachex
