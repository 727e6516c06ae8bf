#include "tierpool/priority_queue.hpp"

#include <algorithm>
#include <iterator>

namespace tierpool {

std::size_t TierQueue::enqueue(Task task) {
  const int rank = priority_rank(task.priority);
  auto pos = std::upper_bound(tasks_.begin(), tasks_.end(), rank,
                              [](int r, const Task& t) { return r < priority_rank(t.priority); });
  pos = tasks_.insert(pos, std::move(task));
  return static_cast<std::size_t>(std::distance(tasks_.begin(), pos)) + 1;
}

std::optional<Task> TierQueue::dequeue_front() {
  if (tasks_.empty()) return std::nullopt;
  Task t = std::move(tasks_.front());
  tasks_.pop_front();
  return t;
}

const Task* TierQueue::peek_front() const {
  return tasks_.empty() ? nullptr : &tasks_.front();
}

std::optional<Task> TierQueue::remove(const std::string& task_id) {
  auto it = std::find_if(tasks_.begin(), tasks_.end(),
                         [&](const Task& t) { return t.id == task_id; });
  if (it == tasks_.end()) return std::nullopt;
  Task t = std::move(*it);
  tasks_.erase(it);
  return t;
}

std::vector<Task> TierQueue::remove_created_before(TimePoint cutoff) {
  std::vector<Task> expired;
  auto keep = std::stable_partition(tasks_.begin(), tasks_.end(),
                                    [&](const Task& t) { return t.created_at > cutoff; });
  expired.assign(std::make_move_iterator(keep), std::make_move_iterator(tasks_.end()));
  tasks_.erase(keep, tasks_.end());
  return expired;
}

std::vector<Task> TierQueue::drain() {
  std::vector<Task> out(std::make_move_iterator(tasks_.begin()),
                        std::make_move_iterator(tasks_.end()));
  tasks_.clear();
  return out;
}

std::size_t PriorityQueueSet::enqueue(Task task) {
  const Tier tier = task.tier;
  return queue(tier).enqueue(std::move(task));
}

std::optional<Task> PriorityQueueSet::remove(const std::string& task_id) {
  for (auto& q : queues_) {
    if (auto t = q.remove(task_id)) return t;
  }
  return std::nullopt;
}

std::vector<Task> PriorityQueueSet::drain_all() {
  std::vector<Task> out;
  for (auto& q : queues_) {
    auto part = q.drain();
    out.insert(out.end(), std::make_move_iterator(part.begin()),
               std::make_move_iterator(part.end()));
  }
  return out;
}

std::size_t PriorityQueueSet::total_size() const {
  std::size_t n = 0;
  for (const auto& q : queues_) n += q.size();
  return n;
}

}  // namespace tierpool
