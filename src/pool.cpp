#include "tierpool/pool.hpp"

#include <algorithm>
#include <chrono>
#include <exception>

#include "tierpool/batch.hpp"
#include "tierpool/fingerprint.hpp"

namespace tierpool {

ValidationPool::ValidationPool(PoolConfig config, TierRegistry registry)
    : config_(std::move(config)),
      registry_(std::move(registry)),
      metrics_(config_.utilization_history),
      events_(config_.event_log_path) {
  if (config_.enable_cache) {
    cache_ = std::make_unique<ResultCache>(config_.cache_max_entries,
                                           bounded_ms(config_.cache_ttl_ms),
                                           config_.cache_eviction);
  }
  // One worker per admission slot at least, so a saturated tier never holds
  // up tasks admitted in another.
  const std::size_t threads =
      std::max(config_.executor_threads, registry_.total_concurrency());
  executor_ = std::make_unique<TaskExecutor>(registry_, cache_.get(), metrics_, threads);
}

ValidationPool::~ValidationPool() {
  stop();

  std::vector<Task> leftover;
  {
    std::lock_guard<std::mutex> lk(state_mu_);
    leftover = queues_.drain_all();
  }
  for (auto& t : leftover) {
    settle(t.id, make_failure(t.id, ErrorCode::pool_stopped, "pool destroyed while task was queued"));
  }
  // Running tasks finish and settle through on_task_settled().
  executor_->stop();
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

void ValidationPool::start() {
  {
    std::lock_guard<std::mutex> lk(loop_mu_);
    if (scheduler_.joinable()) return;
    loop_stopping_ = false;
    scheduler_ = std::thread([this] { scheduler_loop(); });
  }
  running_.store(true, std::memory_order_release);
  log_line("pool started (tick=" + std::to_string(config_.tick_interval_ms) + "ms, queue_timeout=" +
           std::to_string(config_.queue_timeout_ms) + "ms)");
  PoolEvent ev;
  ev.type = PoolEventType::pool_started;
  events_.publish(std::move(ev));
}

void ValidationPool::stop() {
  std::thread worker;
  {
    std::lock_guard<std::mutex> lk(loop_mu_);
    if (!scheduler_.joinable()) return;
    loop_stopping_ = true;
    worker = std::move(scheduler_);
  }
  loop_cv_.notify_all();
  worker.join();
  running_.store(false, std::memory_order_release);
  log_line("pool stopped");
  PoolEvent ev;
  ev.type = PoolEventType::pool_stopped;
  events_.publish(std::move(ev));
}

void ValidationPool::scheduler_loop() {
  const auto interval = bounded_ms(config_.tick_interval_ms);
  while (true) {
    {
      std::unique_lock<std::mutex> lk(loop_mu_);
      loop_cv_.wait_for(lk, interval, [this] { return loop_stopping_; });
      if (loop_stopping_) return;
    }
    tick();
  }
}

// ---------------------------------------------------------------------------
// Submission
// ---------------------------------------------------------------------------

std::string ValidationPool::next_task_id() {
  const std::uint64_t n = id_counter_.fetch_add(1, std::memory_order_relaxed) + 1;
  return "vtask-" + std::to_string(unix_time_ms()) + "-" + std::to_string(n);
}

SubmitHandle ValidationPool::resolved(const std::string& task_id, SubmitOutcome outcome) {
  std::promise<SubmitOutcome> p;
  p.set_value(std::move(outcome));
  return SubmitHandle{task_id, p.get_future().share()};
}

std::optional<SubmitOutcome> ValidationPool::serve_from_cache(const std::string& task_id,
                                                              const TaskSpec& spec,
                                                              const std::string& fingerprint) {
  if (!cache_) return std::nullopt;
  auto hit = cache_->get(fingerprint);
  if (!hit) {
    metrics_.record_cache_miss();
    return std::nullopt;
  }
  metrics_.record_cache_hit();

  SubmitOutcome out;
  out.ok = true;
  out.task_id = task_id;
  out.result = std::move(*hit);
  out.result.task_id = task_id;
  out.result.from_cache = true;

  PoolEvent ev;
  ev.type = PoolEventType::cache_hit;
  ev.task_id = task_id;
  ev.hypothesis_id = spec.hypothesis_id;
  ev.tier = spec.tier;
  ev.result = out.result;
  events_.publish(std::move(ev));
  return out;
}

std::optional<SubmitOutcome> ValidationPool::reject_if_unavailable(const std::string& task_id,
                                                                   const TaskSpec& spec,
                                                                   const TierSpec& tier) {
  if (!config_.fail_fast_unavailable) return std::nullopt;
  std::string reason;
  try {
    if (tier.backend->is_available()) return std::nullopt;
    reason = "backend " + tier.backend->backend_id() + " is not available";
  } catch (const std::exception& e) {
    reason = std::string("availability probe failed: ") + e.what();
  }
  metrics_.record_failed();
  SubmitOutcome out = make_failure(task_id, ErrorCode::pool_unavailable, reason);

  Task t;
  t.id = task_id;
  t.hypothesis_id = spec.hypothesis_id;
  t.tier = spec.tier;
  publish_failure(PoolEventType::failed, t, out);
  return out;
}

void ValidationPool::publish_failure(PoolEventType type, const Task& task,
                                     const SubmitOutcome& outcome) {
  PoolEvent ev;
  ev.type = type;
  ev.task_id = task.id;
  ev.hypothesis_id = task.hypothesis_id;
  ev.tier = task.tier;
  ev.error_code = outcome.error_code;
  ev.error = outcome.error_detail;
  events_.publish(std::move(ev));
}

SubmitHandle ValidationPool::submit_async(const TaskSpec& spec) {
  const std::string id = next_task_id();

  const TierSpec* tier = registry_.find(spec.tier);
  if (!tier || !tier->backend) {
    return resolved(id, make_failure(id, ErrorCode::invalid_request,
                                     "tier not registered: " + to_string(spec.tier)));
  }

  const std::string fingerprint = compute_fingerprint(spec);
  if (auto hit = serve_from_cache(id, spec, fingerprint)) return resolved(id, std::move(*hit));
  if (auto rejected = reject_if_unavailable(id, spec, *tier)) return resolved(id, std::move(*rejected));

  Task task;
  task.id = id;
  task.hypothesis_id = spec.hypothesis_id;
  task.tier = spec.tier;
  task.priority = spec.priority;
  task.request = spec.request;
  task.fingerprint = fingerprint;
  task.created_at = Clock::now();
  task.status = TaskStatus::queued;

  SubmitHandle handle;
  std::size_t position = 0;
  {
    std::lock_guard<std::mutex> lk(state_mu_);
    if (config_.dedupe_inflight) {
      // Attach to the identical task already queued or running.
      if (auto it = inflight_.find(fingerprint); it != inflight_.end()) return it->second;
    }
    auto slot = pending_.emplace(id, std::promise<SubmitOutcome>{}).first;
    handle.task_id = id;
    handle.result = slot->second.get_future().share();
    if (config_.dedupe_inflight) {
      inflight_[fingerprint] = handle;
      inflight_key_[id] = fingerprint;
    }
    position = queues_.enqueue(std::move(task));
  }
  metrics_.record_submitted();

  PoolEvent ev;
  ev.type = PoolEventType::queued;
  ev.task_id = id;
  ev.hypothesis_id = spec.hypothesis_id;
  ev.tier = spec.tier;
  ev.queue_position = position;
  events_.publish(std::move(ev));
  return handle;
}

SubmitOutcome ValidationPool::submit(const TaskSpec& spec) {
  SubmitHandle handle = submit_async(spec);
  const auto budget =
      bounded_ms(config_.queue_timeout_ms) + bounded_ms(config_.caller_timeout_margin_ms);
  if (handle.result.wait_for(budget) != std::future_status::ready) {
    return make_failure(handle.task_id, ErrorCode::caller_timeout,
                        "no terminal outcome within " + std::to_string(budget.count()) + "ms");
  }
  return handle.result.get();
}

std::vector<SubmitOutcome> ValidationPool::submit_batch(const std::vector<TaskSpec>& specs) {
  BatchCoordinator coordinator(*this);
  return coordinator.submit(specs);
}

// ---------------------------------------------------------------------------
// Scheduling
// ---------------------------------------------------------------------------

void ValidationPool::tick() {
  std::vector<Task> expired;
  std::vector<Task> admitted;
  UtilizationSnapshot snap;
  {
    std::lock_guard<std::mutex> lk(state_mu_);
    const TimePoint now = Clock::now();
    const TimePoint cutoff = now - bounded_ms(config_.queue_timeout_ms);

    for (Tier t : kAllTiers) {
      const TierSpec* spec = registry_.find(t);
      if (!spec) continue;
      TierQueue& q = queues_.queue(t);
      auto& running = running_sets_[tier_index(t)];

      // Tasks past the queue timeout never consume a slot.
      for (auto& task : q.remove_created_before(cutoff)) expired.push_back(std::move(task));

      while (running.size() < spec->max_concurrency && !q.empty()) {
        Task task = *q.dequeue_front();
        running.insert(task.id);
        task.status = TaskStatus::running;
        task.started_at = now;
        admitted.push_back(std::move(task));
      }
    }
    snap = utilization_locked();
  }

  for (auto& task : expired) {
    task.status = TaskStatus::failed;
    task.completed_at = Clock::now();
    metrics_.record_queue_timeout();
    SubmitOutcome out = make_failure(
        task.id, ErrorCode::queue_timeout,
        "waited more than " + std::to_string(config_.queue_timeout_ms) + "ms in queue");
    publish_failure(PoolEventType::timeout, task, out);
    settle(task.id, std::move(out));
  }

  for (const auto& task : admitted) {
    PoolEvent ev;
    ev.type = PoolEventType::started;
    ev.task_id = task.id;
    ev.hypothesis_id = task.hypothesis_id;
    ev.tier = task.tier;
    if (const TierSpec* spec = registry_.find(task.tier)) {
      ev.estimated_duration_ms = spec->estimated_duration_ms;
    }
    events_.publish(std::move(ev));
  }

  for (auto& task : admitted) {
    executor_->dispatch(std::move(task), [this](Completion c) { on_task_settled(std::move(c)); });
  }

  if (!expired.empty() || !admitted.empty() || snap.total_active > 0 || snap.total_queued > 0) {
    metrics_.record_utilization(snap);
  }
}

void ValidationPool::on_task_settled(Completion c) {
  {
    std::lock_guard<std::mutex> lk(state_mu_);
    running_sets_[tier_index(c.task.tier)].erase(c.task.id);
  }
  if (c.outcome.ok) {
    PoolEvent ev;
    ev.type = PoolEventType::completed;
    ev.task_id = c.task.id;
    ev.hypothesis_id = c.task.hypothesis_id;
    ev.tier = c.task.tier;
    ev.result = c.outcome.result;
    events_.publish(std::move(ev));
  } else {
    publish_failure(PoolEventType::failed, c.task, c.outcome);
  }
  settle(c.task.id, std::move(c.outcome));
}

void ValidationPool::settle(const std::string& task_id, SubmitOutcome outcome) {
  std::promise<SubmitOutcome> promise;
  {
    std::lock_guard<std::mutex> lk(state_mu_);
    auto it = pending_.find(task_id);
    if (it == pending_.end()) return;
    promise = std::move(it->second);
    pending_.erase(it);
    if (auto key = inflight_key_.find(task_id); key != inflight_key_.end()) {
      inflight_.erase(key->second);
      inflight_key_.erase(key);
    }
  }
  promise.set_value(std::move(outcome));
}

// ---------------------------------------------------------------------------
// Control
// ---------------------------------------------------------------------------

bool ValidationPool::cancel(const std::string& task_id) {
  std::optional<Task> task;
  {
    std::lock_guard<std::mutex> lk(state_mu_);
    task = queues_.remove(task_id);
  }
  if (!task) return false;

  task->status = TaskStatus::cancelled;
  task->completed_at = Clock::now();
  metrics_.record_cancelled();
  SubmitOutcome out = make_failure(task_id, ErrorCode::cancelled, "cancelled while queued");
  publish_failure(PoolEventType::cancelled, *task, out);
  settle(task_id, std::move(out));
  return true;
}

std::size_t ValidationPool::clear_queues() {
  std::vector<Task> drained;
  {
    std::lock_guard<std::mutex> lk(state_mu_);
    drained = queues_.drain_all();
  }
  for (auto& t : drained) {
    settle(t.id, make_failure(t.id, ErrorCode::queues_cleared, "queue cleared before admission"));
  }
  PoolEvent ev;
  ev.type = PoolEventType::queues_cleared;
  ev.count = drained.size();
  events_.publish(std::move(ev));
  log_line("cleared " + std::to_string(drained.size()) + " queued task(s)");
  return drained.size();
}

bool ValidationPool::warm_up(Tier tier, std::size_t count) {
  PoolEvent started;
  started.type = PoolEventType::warmup_started;
  started.tier = tier;
  started.count = count;
  events_.publish(std::move(started));

  const TierSpec* spec = registry_.find(tier);
  std::string reason;
  bool ok = false;
  if (!spec || !spec->backend) {
    reason = "tier not registered";
  } else {
    try {
      ok = spec->backend->is_available();
      if (!ok) reason = "backend not available";
    } catch (const std::exception& e) {
      reason = e.what();
    }
  }

  PoolEvent done;
  done.type = ok ? PoolEventType::warmup_complete : PoolEventType::warmup_failed;
  done.tier = tier;
  done.count = count;
  done.error = reason;
  events_.publish(std::move(done));
  log_line("warm-up " + to_string(tier) + " x" + std::to_string(count) +
           (ok ? " complete" : " failed: " + reason));
  return ok;
}

// ---------------------------------------------------------------------------
// Introspection
// ---------------------------------------------------------------------------

UtilizationSnapshot ValidationPool::utilization_locked() const {
  UtilizationSnapshot u;
  u.timestamp_ms = unix_time_ms();
  for (Tier t : kAllTiers) {
    TierUtilization& tu = u.tiers[tier_index(t)];
    const TierSpec* spec = registry_.find(t);
    tu.tier = t;
    tu.active = running_sets_[tier_index(t)].size();
    tu.max_concurrency = spec ? spec->max_concurrency : 0;
    tu.queued = queues_.size(t);
    tu.ratio = tu.max_concurrency > 0
        ? static_cast<double>(tu.active) / static_cast<double>(tu.max_concurrency)
        : 0.0;
    u.total_active += tu.active;
    u.total_queued += tu.queued;
  }
  return u;
}

UtilizationSnapshot ValidationPool::utilization() const {
  std::lock_guard<std::mutex> lk(state_mu_);
  return utilization_locked();
}

MetricsSnapshot ValidationPool::metrics() const { return metrics_.snapshot(); }

bool ValidationPool::has_capacity(Tier tier) const {
  const TierSpec* spec = registry_.find(tier);
  if (!spec) return false;
  std::lock_guard<std::mutex> lk(state_mu_);
  return running_sets_[tier_index(tier)].size() < spec->max_concurrency;
}

}  // namespace tierpool
