#pragma once
// Per-member ZADD decision given the score currently stored (if any)
#include <optional>
#include "../../types.hpp"

namespace cachex {

enum class ZAddAction { SKIP, INSERT, UPDATE };

struct ZAddDecision {
    ZAddAction action = ZAddAction::SKIP;
    bool counted = false;   // contributes to the ZADD return value
};

inline ZAddDecision decide_zadd(std::optional<double> current, double score, const ZAddFlags& f) {
    if (!current) {
        if (f.xx) return {};
        return {ZAddAction::INSERT, true};
    }
    if (f.nx) return {};

    bool update = true;
    if (f.gt && f.lt) {
        update = false;
    } else if (f.gt) {
        update = score > *current;
    } else if (f.lt) {
        update = score < *current;
    }
    if (!update) return {};
    return {ZAddAction::UPDATE, f.ch && score != *current};
}

} // namespace cachex
