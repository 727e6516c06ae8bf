#pragma once

// tierpool/batch.hpp: Bulk execution of compatible submissions.
//
// ALGORITHM:
//   1. Partition submissions by (tier, request kind).
//   2. A group of two or more whose backend supports_batch(kind) takes the bulk
//      path: cache check per entry, then ONE execute_batch() call carrying every
//      miss. Replies fan back out in input order; each entry is validated,
//      cached and counted exactly as the single-task executor would.
//   3. Everything else falls through to ValidationPool::submit_async() and the
//      normal queue/scheduler/executor path.
//   4. submit() joins every handle and returns outcomes in input order.
//
// The bulk path bypasses tier queues and running sets; the backend owns
// capacity for a bulk call.
//
// FAILURE ATTRIBUTION:
//   Whole-call failure (error reply or thrown std::exception) -> each miss gets
//   execution_failure. A missing, error or malformed entry -> that entry alone
//   gets batch_partial_failure; its siblings still succeed.

#include <optional>
#include <vector>

#include "tierpool/pool.hpp"
#include "tierpool/types.hpp"

namespace tierpool {

class BatchCoordinator {
 public:
  explicit BatchCoordinator(ValidationPool& pool) : pool_(pool) {}

  std::vector<SubmitOutcome> submit(const std::vector<TaskSpec>& specs);

 private:
  void run_bulk(const TierSpec& tier, RequestKind kind, const std::vector<std::size_t>& indices,
                const std::vector<TaskSpec>& specs, std::vector<std::optional<SubmitOutcome>>& out);

  ValidationPool& pool_;
};

}  // namespace tierpool
