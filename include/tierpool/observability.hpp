#pragma once

// tierpool/observability.hpp: Pool lifecycle events and latency histogram.
//
// DESIGN:
//   PoolEvent is the observable unit. Every lifecycle transition publishes one
//   event on the pool's EventBus, which:
//     - fans out to subscribed handlers (tests, CLI progress, exporters);
//     - appends one JSON line per event to an event log when a path is
//       configured (PoolConfig::event_log_path or TIERPOOL_EVENT_LOG).
//
// ORDERING:
//   The scheduler publishes `started` events for one tick in dispatch order,
//   before any of those tasks reaches the executor. Per-task completion is
//   delivered through the submitter's future, not by filtering this bus.
//
// Handlers run on the publishing thread, outside the bus lock. A handler may
// unsubscribe itself or others while being invoked. A handler that throws is
// logged to stderr and does not affect other handlers or the pool.
//
// EXTENSION_POINT: OpenTelemetry_exporter
//   Subscribe a handler that maps PoolEvent to spans. Only ids, tiers, codes
//   and durations should leave the process, never parameter payloads.

#include <array>
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "tierpool/types.hpp"

namespace tierpool {

enum class PoolEventType {
  queued,
  started,
  completed,
  failed,
  timeout,
  cancelled,
  cache_hit,
  warmup_started,
  warmup_complete,
  warmup_failed,
  queues_cleared,
  pool_started,
  pool_stopped,
};

std::string to_string(PoolEventType t);

struct PoolEvent {
  PoolEventType type{PoolEventType::queued};
  std::string task_id;
  std::string hypothesis_id;
  std::optional<Tier> tier;
  std::size_t queue_position{0};          // queued
  std::uint64_t estimated_duration_ms{0}; // started
  ErrorCode error_code{ErrorCode::none};  // failed / timeout / cancelled
  std::string error;
  std::optional<ValidationResult> result; // completed / cache_hit
  std::size_t count{0};                   // queues_cleared
  std::uint64_t timestamp_ms{0};
};

std::string event_to_json(const PoolEvent& ev);

// ---------------------------------------------------------------------------
// EventBus
// ---------------------------------------------------------------------------
class EventBus {
 public:
  using Handler = std::function<void(const PoolEvent&)>;
  using SubscriptionId = std::uint64_t;

  explicit EventBus(std::string log_path = {});

  SubscriptionId subscribe(Handler handler);
  bool unsubscribe(SubscriptionId id);

  // Stamps timestamp_ms if unset, then delivers.
  void publish(PoolEvent ev);

  std::size_t subscriber_count() const;
  std::uint64_t published() const { return published_.load(std::memory_order_relaxed); }
  const std::string& log_path() const { return log_path_; }

 private:
  void append_log(const PoolEvent& ev);

  mutable std::mutex mu_;
  std::map<SubscriptionId, std::shared_ptr<Handler>> handlers_;
  SubscriptionId next_id_{1};
  std::atomic<std::uint64_t> published_{0};

  std::string log_path_;
  std::mutex log_mu_;
};

// ---------------------------------------------------------------------------
// LatencyHistogram: power-of-two bucket histogram
// ---------------------------------------------------------------------------
// Bucket i covers durations in [2^(i-1) ms, 2^i ms); bucket 0 is [0, 1ms).
// Invariant: bucket boundaries are fixed; readers of the JSON rely on them.
class LatencyHistogram {
 public:
  static constexpr std::size_t kBuckets = 32;

  void record_ms(std::uint64_t duration_ms);

  // Approximate percentile in ms, p in [0.0, 1.0]. 0.0 with no samples.
  double percentile(double p) const;

  std::uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  double mean_ms() const;

  std::string to_json() const;

 private:
  // MICRO_DOCUMENTED: buckets_ and counters on separate cache lines; executor
  // workers record concurrently.
  alignas(64) std::array<std::atomic<std::uint64_t>, kBuckets> buckets_{};
  alignas(64) std::atomic<std::uint64_t> count_{0};
  alignas(64) std::atomic<std::uint64_t> sum_ms_{0};
};

// Writes "[tierpool] <message>" to stderr. Used for lifecycle lines only.
void log_line(const std::string& message);

}  // namespace tierpool
