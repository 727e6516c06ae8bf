#pragma once

// tierpool/tier_registry.hpp: Static tier -> execution handle mapping.
//
// Built once before the pool is constructed and never mutated afterwards.
// Every tier the pool schedules must be registered; submitting to an
// unregistered tier resolves immediately with invalid_request.

#include <array>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "tierpool/backend.hpp"
#include "tierpool/types.hpp"

namespace tierpool {

struct PoolConfig;

struct TierSpec {
  Tier tier{Tier::t4};
  std::shared_ptr<IExecutionBackend> backend;
  std::size_t max_concurrency{1};
  double cost_per_task{0.0};
  std::uint64_t estimated_duration_ms{0};
};

double default_cost_per_task(Tier t);
std::uint64_t default_estimated_duration_ms(Tier t);

class TierRegistry {
 public:
  using BackendFactory = std::function<std::shared_ptr<IExecutionBackend>(Tier)>;

  // Replaces an existing registration for the same tier.
  void register_tier(TierSpec spec);

  const TierSpec* find(Tier t) const;
  bool contains(Tier t) const { return find(t) != nullptr; }
  std::vector<Tier> tiers() const;
  // Sum of max_concurrency over registered tiers.
  std::size_t total_concurrency() const;

  // One registration per tier with concurrency from `cfg` and default costs.
  static TierRegistry from_config(const PoolConfig& cfg, const BackendFactory& factory);

 private:
  std::array<std::optional<TierSpec>, kTierCount> specs_;
};

}  // namespace tierpool
