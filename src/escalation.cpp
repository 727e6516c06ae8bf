#include "tierpool/escalation.hpp"

#include <algorithm>

namespace tierpool {

Tier select_tier_by_score(double score) {
  if (score >= 8.5) return Tier::a100;
  if (score >= 7.0) return Tier::a10g;
  return Tier::t4;
}

Priority select_priority_by_score(double score) {
  if (score >= 9.0) return Priority::critical;
  if (score >= 8.0) return Priority::high;
  if (score >= 7.0) return Priority::normal;
  return Priority::low;
}

std::optional<Tier> escalate_tier(Tier t) {
  switch (t) {
    case Tier::t4:   return Tier::a10g;
    case Tier::a10g: return Tier::a100;
    case Tier::a100: return std::nullopt;
  }
  return std::nullopt;
}

double score_adjustment(const ValidationResult& result) {
  double adj = 0.0;
  if (result.physics_valid) {
    adj += 0.3;
    if (result.confidence_score > 0.9) adj += 0.1;
    if (result.confidence_score > 0.95) adj += 0.1;
  } else {
    adj -= 0.3;
    if (result.confidence_score < 0.5) adj -= 0.2;
  }
  if (result.economically_viable) {
    adj += 0.2;
    auto it = result.metrics.find("lcoe");
    if (it != result.metrics.end() && it->second.mean < 0.05) adj += 0.1;
  } else {
    adj -= 0.1;
  }
  return std::clamp(adj, -0.5, 0.5);
}

}  // namespace tierpool
