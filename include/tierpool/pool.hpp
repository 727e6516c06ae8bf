#pragma once

// tierpool/pool.hpp: Tiered validation pool: admission, scheduling, completion.
//
// LIFECYCLE:
//   ValidationPool is an ordinary object: construct it with a config and a tier
//   registry, start() the scheduler, stop() it, destroy it. There is no global
//   instance. Tasks submitted while the scheduler is stopped stay queued until
//   start(); the destructor resolves any still-queued task with pool_stopped
//   and lets running tasks finish.
//
// STATE:
//   Queue membership, running sets, pending result channels and the in-flight
//   map are guarded by one state mutex. Every mutation of them (submit, tick,
//   completion, cancel, clear) happens inside that critical section, so the
//   pool behaves as one logical thread of control over that state. Backend
//   calls, event handlers and promise resolution always run outside it.
//
// COMPLETION:
//   Each submitted task owns one promise; submit_async() hands back its
//   shared_future. The EventBus carries the same transitions for observers but
//   is not how callers receive their result.
//
// ORDERING:
//   Per tier, admission is strict priority with FIFO tie-break. `started`
//   events of one tick are published in admission order before any of those
//   tasks reaches the executor. Tiers are independent.

#include <array>
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "tierpool/config.hpp"
#include "tierpool/executor.hpp"
#include "tierpool/metrics.hpp"
#include "tierpool/observability.hpp"
#include "tierpool/priority_queue.hpp"
#include "tierpool/result_cache.hpp"
#include "tierpool/tier_registry.hpp"
#include "tierpool/types.hpp"

namespace tierpool {

struct SubmitHandle {
  std::string task_id;
  std::shared_future<SubmitOutcome> result;
};

class ValidationPool {
 public:
  ValidationPool(PoolConfig config, TierRegistry registry);
  ~ValidationPool();

  ValidationPool(const ValidationPool&) = delete;
  ValidationPool& operator=(const ValidationPool&) = delete;

  void start();
  void stop();
  bool running() const { return running_.load(std::memory_order_acquire); }

  // Blocks until the task settles or queue_timeout_ms + caller_timeout_margin_ms
  // elapses (caller_timeout). Never throws for task failures.
  SubmitOutcome submit(const TaskSpec& spec);

  // Cache hits, invalid tiers and fail-fast rejections come back already resolved.
  // With dedupe_inflight, an identical queued or running submission returns
  // the existing task's handle.
  SubmitHandle submit_async(const TaskSpec& spec);

  // Outcomes in input order. See batch.hpp.
  std::vector<SubmitOutcome> submit_batch(const std::vector<TaskSpec>& specs);

  // Queued tasks only. Running, finished and unknown ids return false.
  // With dedupe_inflight, callers attached to one task share its id, so
  // cancelling it resolves every attached caller with `cancelled`.
  bool cancel(const std::string& task_id);

  // Health probe of the tier's backend. Best effort; reserves nothing.
  bool warm_up(Tier tier, std::size_t count = 1);

  UtilizationSnapshot utilization() const;
  MetricsSnapshot metrics() const;
  bool has_capacity(Tier tier) const;

  // Resolves every queued task with queues_cleared. Running tasks continue.
  std::size_t clear_queues();

  // One scheduler pass over every tier. Driven by the scheduler thread;
  // callable directly when the scheduler is stopped.
  void tick();

  EventBus& events() { return events_; }
  const PoolConfig& config() const { return config_; }
  const TierRegistry& registry() const { return registry_; }
  const ResultCache* cache() const { return cache_.get(); }

 private:
  friend class BatchCoordinator;

  std::string next_task_id();
  static SubmitHandle resolved(const std::string& task_id, SubmitOutcome outcome);

  std::optional<SubmitOutcome> serve_from_cache(const std::string& task_id, const TaskSpec& spec,
                                                const std::string& fingerprint);
  std::optional<SubmitOutcome> reject_if_unavailable(const std::string& task_id,
                                                     const TaskSpec& spec, const TierSpec& tier);
  void publish_failure(PoolEventType type, const Task& task, const SubmitOutcome& outcome);

  // Fulfils the task's promise (if still pending) and forgets it.
  void settle(const std::string& task_id, SubmitOutcome outcome);
  void on_task_settled(Completion c);
  UtilizationSnapshot utilization_locked() const;
  void scheduler_loop();

  const PoolConfig config_;
  const TierRegistry registry_;
  std::unique_ptr<ResultCache> cache_;
  PoolMetrics metrics_;
  EventBus events_;

  mutable std::mutex state_mu_;
  PriorityQueueSet queues_;
  std::array<std::unordered_set<std::string>, kTierCount> running_sets_;
  std::unordered_map<std::string, std::promise<SubmitOutcome>> pending_;
  std::unordered_map<std::string, SubmitHandle> inflight_;     // fingerprint -> first submission
  std::unordered_map<std::string, std::string> inflight_key_;  // task id -> fingerprint

  std::atomic<std::uint64_t> id_counter_{0};
  std::atomic<bool> running_{false};

  std::mutex loop_mu_;
  std::condition_variable loop_cv_;
  bool loop_stopping_{false};
  std::thread scheduler_;

  std::unique_ptr<TaskExecutor> executor_;
};

}  // namespace tierpool
