#pragma once

// tierpool/config.hpp: Static pool configuration.
//
// Precedence, lowest to highest:
//   1. compiled defaults (PoolConfig member initializers)
//   2. JSON config document (parse_config_json)
//   3. environment (apply_env_overrides):
//        TIERPOOL_QUEUE_TIMEOUT_MS, TIERPOOL_TICK_MS, TIERPOOL_CACHE_TTL_MS,
//        TIERPOOL_CACHE_MAX, TIERPOOL_CACHE (0|1)
//
// Config is read once at pool construction. There is no hot reload.
//
// JSON shape (every key optional):
//   {"max_concurrency":{"t4":10,"a10g":5,"a100":2},
//    "queue_timeout_ms":30000,"caller_timeout_margin_ms":60000,
//    "enable_cache":true,"cache_ttl_ms":300000,"cache_max_entries":100,
//    "cache_eviction":"insertion_order","tick_interval_ms":50,
//    "utilization_history":120,"fail_fast_unavailable":false,
//    "dedupe_inflight":false,"executor_threads":0,"event_log_path":""}

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "tierpool/result_cache.hpp"
#include "tierpool/types.hpp"

namespace tierpool {

struct PoolConfig {
  std::array<std::size_t, kTierCount> max_concurrency{10, 5, 2};  // indexed by tier_index()
  std::uint64_t queue_timeout_ms{30000};
  std::uint64_t caller_timeout_margin_ms{60000};
  bool enable_cache{true};
  std::uint64_t cache_ttl_ms{300000};
  std::size_t cache_max_entries{100};
  EvictionPolicy cache_eviction{EvictionPolicy::insertion_order};
  std::uint64_t tick_interval_ms{50};
  std::size_t utilization_history{120};
  bool fail_fast_unavailable{false};
  bool dedupe_inflight{false};
  std::size_t executor_threads{0};  // raised to the registry's total slots
  std::string event_log_path;       // empty = TIERPOOL_EVENT_LOG or none

  std::size_t max_concurrency_for(Tier t) const { return max_concurrency[tier_index(t)]; }
};

struct ConfigValidationResult {
  bool ok{false};
  std::string config_version;
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
};

// Structural checks on a JSON config document. Never throws.
ConfigValidationResult validate_config(const std::string& config_json);

// Range checks on a built config (zero concurrency, zero tick, ...).
std::vector<std::string> check_config(const PoolConfig& cfg);

// Overlays a JSON document onto `base`. Returns nullopt (and fills *errors)
// if the document is malformed or fails check_config().
std::optional<PoolConfig> parse_config_json(const std::string& config_json,
                                            const PoolConfig& base,
                                            std::vector<std::string>* errors);

// Malformed environment values are ignored with a [tierpool] warning line.
void apply_env_overrides(PoolConfig& cfg);

// defaults -> file at `path` (skipped when empty) -> environment.
std::optional<PoolConfig> load_config(const std::string& path, std::vector<std::string>* errors);

std::string config_to_json(const PoolConfig& cfg);

}  // namespace tierpool
