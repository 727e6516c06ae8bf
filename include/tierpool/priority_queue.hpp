#pragma once

// tierpool/priority_queue.hpp: Per-tier priority-ordered task queues.
//
// ORDERING INVARIANT (per tier):
//   Tasks are ordered by ascending priority rank (critical=0 .. low=3); within
//   a rank, by insertion order. A new task goes after every task whose rank is
//   <= its own, so equal-priority tasks are FIFO.
//
// Tiers are independent: no cross-tier ordering exists.
//
// Thread-safety: none. The pool serializes every call under its state mutex
// (pool.hpp). Keeping the lock outside lets the pool update queues and the
// running set in one critical section.

#include <array>
#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <vector>

#include "tierpool/types.hpp"

namespace tierpool {

class TierQueue {
 public:
  // Returns the 1-based position the task now occupies.
  std::size_t enqueue(Task task);

  std::optional<Task> dequeue_front();
  const Task* peek_front() const;

  // Removes the task with this id, preserving the order of the others.
  std::optional<Task> remove(const std::string& task_id);

  // Removes every task created at or before `cutoff`, in queue order.
  std::vector<Task> remove_created_before(TimePoint cutoff);

  std::vector<Task> drain();

  std::size_t size() const { return tasks_.size(); }
  bool empty() const { return tasks_.empty(); }

 private:
  std::deque<Task> tasks_;
};

class PriorityQueueSet {
 public:
  std::size_t enqueue(Task task);

  TierQueue& queue(Tier tier) { return queues_[tier_index(tier)]; }
  const TierQueue& queue(Tier tier) const { return queues_[tier_index(tier)]; }

  // Searches every tier.
  std::optional<Task> remove(const std::string& task_id);

  std::vector<Task> drain_all();

  std::size_t size(Tier tier) const { return queue(tier).size(); }
  std::size_t total_size() const;

 private:
  std::array<TierQueue, kTierCount> queues_;
};

}  // namespace tierpool
