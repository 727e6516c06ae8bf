#pragma once

// tierpool/executor.hpp: Runs one admitted task against its tier backend.
//
// RESPONSIBILITY (per task):
//   call backend -> validate reply -> build ValidationResult -> cache put ->
//   metrics update -> status completed/failed -> completion handler.
//
// The executor never retries and never touches queues or running sets. The
// completion handler (owned by the pool) removes the task from its running set
// and publishes the terminal event.
//
// THREADING:
//   A fixed worker pool (at least TierRegistry::total_concurrency()) drains a job
//   deque. dispatch() never blocks on execution; the scheduler tick returns as
//   soon as its tasks are handed over. stop() lets queued jobs finish, then
//   joins every worker.

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "tierpool/backend.hpp"
#include "tierpool/metrics.hpp"
#include "tierpool/result_cache.hpp"
#include "tierpool/tier_registry.hpp"
#include "tierpool/types.hpp"

namespace tierpool {

struct Completion {
  Task task;
  SubmitOutcome outcome;
};

// Shared by the single and bulk paths so both build identical results.
ValidationResult build_result(const std::string& task_id, const std::string& hypothesis_id,
                              const TierSpec& spec, const BackendReply& reply, double duration_ms);

class TaskExecutor {
 public:
  using CompletionHandler = std::function<void(Completion)>;

  // `cache` may be null (caching disabled).
  TaskExecutor(const TierRegistry& registry, ResultCache* cache, PoolMetrics& metrics,
               std::size_t threads);
  ~TaskExecutor();

  TaskExecutor(const TaskExecutor&) = delete;
  TaskExecutor& operator=(const TaskExecutor&) = delete;

  void dispatch(Task task, CompletionHandler on_done);

  // Synchronous body of one execution. Never throws for backend failures.
  Completion run(Task task);

  void stop();

  std::size_t pending() const;
  std::size_t thread_count() const { return workers_.size(); }

 private:
  void worker_loop();
  Completion fail(Task task, ErrorCode code, std::string detail);

  const TierRegistry& registry_;
  ResultCache* cache_;
  PoolMetrics& metrics_;

  std::vector<std::thread> workers_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<std::function<void()>> jobs_;
  bool stopping_{false};
};

}  // namespace tierpool
