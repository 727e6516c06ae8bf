#pragma once

// tierpool/escalation.hpp: Score-driven tier and priority selection.
//
// Callers rank hypotheses on a 0..10 score and use these helpers to pick where
// a validation runs, then feed the result back through score_adjustment().

#include <optional>

#include "tierpool/types.hpp"

namespace tierpool {

// >= 8.5 a100, >= 7.0 a10g, otherwise t4.
Tier select_tier_by_score(double score);

// >= 9.0 critical, >= 8.0 high, >= 7.0 normal, otherwise low.
Priority select_priority_by_score(double score);

// t4 -> a10g -> a100 -> nullopt.
std::optional<Tier> escalate_tier(Tier t);

// Score delta in [-0.5, 0.5] derived from a validation result.
double score_adjustment(const ValidationResult& result);

}  // namespace tierpool
