#pragma once

// tierpool/metrics.hpp: Pool metrics and per-tier utilization.
//
// Counters are process-wide for one pool instance and reset only when the pool
// is reconstructed. Average duration is maintained online:
//   avg_n = avg_{n-1} + (x_n - avg_{n-1}) / n
// so no per-task history is retained. The only retained history is the
// bounded utilization ring (capacity = PoolConfig::utilization_history).
//
// Thread-safety: counters are atomics; the running average, total cost and the
// ring are guarded by one mutex. Snapshots are taken under that mutex.

#include <array>
#include <atomic>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

#include "tierpool/observability.hpp"
#include "tierpool/types.hpp"

namespace tierpool {

struct TierUtilization {
  Tier tier{Tier::t4};
  std::size_t active{0};
  std::size_t max_concurrency{0};
  std::size_t queued{0};
  double ratio{0.0};  // active / max_concurrency, 0 when max is 0
};

struct UtilizationSnapshot {
  std::uint64_t timestamp_ms{0};
  std::array<TierUtilization, kTierCount> tiers{};
  std::size_t total_active{0};
  std::size_t total_queued{0};
};

std::string utilization_to_json(const UtilizationSnapshot& u);

struct MetricsSnapshot {
  std::uint64_t submitted{0};
  std::uint64_t completed{0};
  std::uint64_t failed{0};
  std::uint64_t queue_timeouts{0};
  std::uint64_t cancelled{0};
  std::uint64_t cache_hits{0};
  std::uint64_t cache_misses{0};
  std::uint64_t batch_calls{0};
  double total_cost{0.0};
  double average_duration_ms{0.0};
  std::vector<UtilizationSnapshot> utilization_history;
  std::string latency_json;
};

std::string metrics_to_json(const MetricsSnapshot& m);

class PoolMetrics {
 public:
  explicit PoolMetrics(std::size_t history_capacity = 120);

  void record_submitted() { submitted_.fetch_add(1, std::memory_order_relaxed); }
  void record_cache_hit() { cache_hits_.fetch_add(1, std::memory_order_relaxed); }
  void record_cache_miss() { cache_misses_.fetch_add(1, std::memory_order_relaxed); }
  void record_failed() { failed_.fetch_add(1, std::memory_order_relaxed); }
  void record_queue_timeout() { queue_timeouts_.fetch_add(1, std::memory_order_relaxed); }
  void record_cancelled() { cancelled_.fetch_add(1, std::memory_order_relaxed); }
  void record_batch_call() { batch_calls_.fetch_add(1, std::memory_order_relaxed); }

  // A fresh (non-cached) completion.
  void record_completed(double duration_ms, double cost);

  void record_utilization(const UtilizationSnapshot& snap);

  MetricsSnapshot snapshot() const;

  std::uint64_t completed() const { return completed_.load(std::memory_order_relaxed); }
  std::uint64_t failed() const { return failed_.load(std::memory_order_relaxed); }

 private:
  std::atomic<std::uint64_t> submitted_{0};
  std::atomic<std::uint64_t> completed_{0};
  std::atomic<std::uint64_t> failed_{0};
  std::atomic<std::uint64_t> queue_timeouts_{0};
  std::atomic<std::uint64_t> cancelled_{0};
  std::atomic<std::uint64_t> cache_hits_{0};
  std::atomic<std::uint64_t> cache_misses_{0};
  std::atomic<std::uint64_t> batch_calls_{0};

  LatencyHistogram latency_;

  mutable std::mutex mu_;
  double total_cost_{0.0};
  double average_duration_ms_{0.0};
  std::uint64_t duration_samples_{0};
  const std::size_t history_capacity_;
  std::deque<UtilizationSnapshot> history_;
};

}  // namespace tierpool
