#include "tierpool/executor.hpp"

#include <chrono>
#include <exception>

namespace tierpool {

ValidationResult build_result(const std::string& task_id, const std::string& hypothesis_id,
                              const TierSpec& spec, const BackendReply& reply, double duration_ms) {
  ValidationResult r;
  r.task_id = task_id;
  r.hypothesis_id = hypothesis_id;
  r.tier = spec.tier;
  r.physics_valid = reply.physics_valid;
  r.economically_viable = reply.economically_viable;
  r.confidence_score = reply.confidence_score;
  r.metrics = reply.metrics;
  r.duration_ms = duration_ms;
  r.cost = spec.cost_per_task;
  r.from_cache = false;
  return r;
}

TaskExecutor::TaskExecutor(const TierRegistry& registry, ResultCache* cache, PoolMetrics& metrics,
                           std::size_t threads)
    : registry_(registry), cache_(cache), metrics_(metrics) {
  if (threads == 0) threads = 1;
  workers_.reserve(threads);
  for (std::size_t i = 0; i < threads; ++i) {
    workers_.emplace_back([this] { worker_loop(); });
  }
}

TaskExecutor::~TaskExecutor() { stop(); }

void TaskExecutor::stop() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    stopping_ = true;
  }
  cv_.notify_all();
  for (auto& w : workers_) {
    if (w.joinable()) w.join();
  }
}

std::size_t TaskExecutor::pending() const {
  std::lock_guard<std::mutex> lk(mu_);
  return jobs_.size();
}

void TaskExecutor::dispatch(Task task, CompletionHandler on_done) {
  auto job = [this, task = std::move(task), on_done = std::move(on_done)]() mutable {
    Completion c = run(std::move(task));
    if (on_done) on_done(std::move(c));
  };
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (!stopping_) {
      jobs_.emplace_back(std::move(job));
      cv_.notify_one();
      return;
    }
  }
  // Workers are gone; run inline so the task still settles exactly once.
  job();
}

void TaskExecutor::worker_loop() {
  while (true) {
    std::function<void()> job;
    {
      std::unique_lock<std::mutex> lk(mu_);
      cv_.wait(lk, [this] { return stopping_ || !jobs_.empty(); });
      if (stopping_ && jobs_.empty()) return;
      job = std::move(jobs_.front());
      jobs_.pop_front();
    }
    job();
  }
}

Completion TaskExecutor::fail(Task task, ErrorCode code, std::string detail) {
  metrics_.record_failed();
  task.status = TaskStatus::failed;
  task.completed_at = Clock::now();
  Completion c;
  c.outcome = make_failure(task.id, code, std::move(detail));
  c.task = std::move(task);
  return c;
}

Completion TaskExecutor::run(Task task) {
  const TierSpec* spec = registry_.find(task.tier);
  if (!spec || !spec->backend) {
    std::string detail = "tier not registered: " + to_string(task.tier);
    return fail(std::move(task), ErrorCode::invalid_request, std::move(detail));
  }

  const auto start = Clock::now();
  BackendReply reply;
  try {
    reply = spec->backend->execute_single(task.hypothesis_id, task.request);
  } catch (const std::exception& e) {
    return fail(std::move(task), ErrorCode::execution_failure, e.what());
  } catch (...) {
    return fail(std::move(task), ErrorCode::execution_failure, "unknown exception");
  }
  if (!reply.ok) {
    return fail(std::move(task), ErrorCode::execution_failure,
                reply.error.empty() ? "backend returned an error" : reply.error);
  }
  if (std::string problem = validate_reply(reply); !problem.empty()) {
    return fail(std::move(task), ErrorCode::execution_failure, "malformed reply: " + problem);
  }

  const auto end = Clock::now();
  const double duration_ms = std::chrono::duration<double, std::milli>(end - start).count();

  Completion c;
  c.outcome.ok = true;
  c.outcome.task_id = task.id;
  c.outcome.result = build_result(task.id, task.hypothesis_id, *spec, reply, duration_ms);

  if (cache_ && !task.fingerprint.empty()) cache_->put(task.fingerprint, c.outcome.result);
  metrics_.record_completed(duration_ms, spec->cost_per_task);

  task.status = TaskStatus::completed;
  task.completed_at = end;
  c.task = std::move(task);
  return c;
}

}  // namespace tierpool
