#include "tierpool/tier_registry.hpp"

#include "tierpool/config.hpp"

namespace tierpool {

double default_cost_per_task(Tier t) {
  switch (t) {
    case Tier::t4:   return 0.01;
    case Tier::a10g: return 0.02;
    case Tier::a100: return 0.05;
  }
  return 0.01;
}

std::uint64_t default_estimated_duration_ms(Tier t) {
  switch (t) {
    case Tier::t4:   return 15000;
    case Tier::a10g: return 20000;
    case Tier::a100: return 25000;
  }
  return 15000;
}

void TierRegistry::register_tier(TierSpec spec) {
  specs_[tier_index(spec.tier)] = std::move(spec);
}

const TierSpec* TierRegistry::find(Tier t) const {
  const auto& slot = specs_[tier_index(t)];
  return slot ? &*slot : nullptr;
}

std::vector<Tier> TierRegistry::tiers() const {
  std::vector<Tier> out;
  for (Tier t : kAllTiers) {
    if (contains(t)) out.push_back(t);
  }
  return out;
}

std::size_t TierRegistry::total_concurrency() const {
  std::size_t total = 0;
  for (const auto& spec : specs_) {
    if (spec) total += spec->max_concurrency;
  }
  return total;
}

TierRegistry TierRegistry::from_config(const PoolConfig& cfg, const BackendFactory& factory) {
  TierRegistry reg;
  for (Tier t : kAllTiers) {
    TierSpec spec;
    spec.tier = t;
    spec.backend = factory(t);
    spec.max_concurrency = cfg.max_concurrency_for(t);
    spec.cost_per_task = default_cost_per_task(t);
    spec.estimated_duration_ms = default_estimated_duration_ms(t);
    reg.register_tier(std::move(spec));
  }
  return reg;
}

}  // namespace tierpool
