#include "tierpool/batch.hpp"

#include <chrono>
#include <exception>
#include <map>
#include <thread>
#include <utility>

#include "tierpool/fingerprint.hpp"

namespace tierpool {

std::vector<SubmitOutcome> BatchCoordinator::submit(const std::vector<TaskSpec>& specs) {
  const auto deadline = Clock::now() + std::chrono::milliseconds(pool_.config_.queue_timeout_ms +
                                                                 pool_.config_.caller_timeout_margin_ms);

  std::map<std::pair<Tier, RequestKind>, std::vector<std::size_t>> groups;
  for (std::size_t i = 0; i < specs.size(); ++i) {
    groups[{specs[i].tier, request_kind(specs[i].request)}].push_back(i);
  }

  std::vector<std::optional<SubmitOutcome>> bulk_out(specs.size());
  std::vector<std::optional<SubmitHandle>> handles(specs.size());
  std::vector<std::thread> bulk_calls;

  for (const auto& group : groups) {
    const Tier tier = group.first.first;
    const RequestKind kind = group.first.second;
    const std::vector<std::size_t>& indices = group.second;
    const TierSpec* spec = pool_.registry_.find(tier);
    if (spec && spec->backend && indices.size() >= 2 && spec->backend->supports_batch(kind)) {
      // Groups write disjoint indices of bulk_out; join() publishes them.
      bulk_calls.emplace_back([this, spec, kind, &indices, &specs, &bulk_out] {
        run_bulk(*spec, kind, indices, specs, bulk_out);
      });
      continue;
    }
    for (std::size_t i : indices) handles[i] = pool_.submit_async(specs[i]);
  }

  for (auto& t : bulk_calls) t.join();

  std::vector<SubmitOutcome> outcomes;
  outcomes.reserve(specs.size());
  for (std::size_t i = 0; i < specs.size(); ++i) {
    if (bulk_out[i]) {
      outcomes.push_back(std::move(*bulk_out[i]));
      continue;
    }
    const SubmitHandle& h = *handles[i];
    if (h.result.wait_until(deadline) != std::future_status::ready) {
      outcomes.push_back(make_failure(h.task_id, ErrorCode::caller_timeout,
                                      "batch member did not settle before the caller deadline"));
      continue;
    }
    outcomes.push_back(h.result.get());
  }
  return outcomes;
}

void BatchCoordinator::run_bulk(const TierSpec& tier, RequestKind kind,
                                const std::vector<std::size_t>& indices,
                                const std::vector<TaskSpec>& specs,
                                std::vector<std::optional<SubmitOutcome>>& out) {
  struct Miss {
    std::size_t index;
    std::string task_id;
    std::string fingerprint;
  };
  std::vector<Miss> misses;
  std::vector<BatchItem> items;

  for (std::size_t i : indices) {
    const TaskSpec& spec = specs[i];
    std::string id = pool_.next_task_id();
    std::string fingerprint = compute_fingerprint(spec);
    if (auto hit = pool_.serve_from_cache(id, spec, fingerprint)) {
      out[i] = std::move(*hit);
      continue;
    }
    if (auto rejected = pool_.reject_if_unavailable(id, spec, tier)) {
      out[i] = std::move(*rejected);
      continue;
    }
    pool_.metrics_.record_submitted();
    items.push_back(BatchItem{spec.hypothesis_id, spec.request});
    misses.push_back(Miss{i, std::move(id), std::move(fingerprint)});
  }
  if (misses.empty()) return;

  for (const Miss& m : misses) {
    PoolEvent ev;
    ev.type = PoolEventType::started;
    ev.task_id = m.task_id;
    ev.hypothesis_id = specs[m.index].hypothesis_id;
    ev.tier = tier.tier;
    ev.estimated_duration_ms = tier.estimated_duration_ms;
    pool_.events_.publish(std::move(ev));
  }

  pool_.metrics_.record_batch_call();
  const auto start = Clock::now();
  BatchReply reply;
  try {
    reply = tier.backend->execute_batch(kind, items);
  } catch (const std::exception& e) {
    reply = BatchReply{};
    reply.error = e.what();
  }
  const double elapsed_ms = std::chrono::duration<double, std::milli>(Clock::now() - start).count();
  const double per_entry_ms = elapsed_ms / static_cast<double>(misses.size());

  for (std::size_t k = 0; k < misses.size(); ++k) {
    const Miss& m = misses[k];
    const TaskSpec& spec = specs[m.index];

    Task task;
    task.id = m.task_id;
    task.hypothesis_id = spec.hypothesis_id;
    task.tier = spec.tier;

    std::optional<SubmitOutcome> failure;
    if (!reply.ok) {
      failure = make_failure(m.task_id, ErrorCode::execution_failure,
                             "bulk call failed: " + (reply.error.empty() ? std::string("error reply") : reply.error));
    } else if (k >= reply.entries.size() || !reply.entries[k]) {
      failure = make_failure(m.task_id, ErrorCode::batch_partial_failure,
                             "entry " + std::to_string(k) + " missing from bulk reply");
    } else if (!reply.entries[k]->ok) {
      failure = make_failure(m.task_id, ErrorCode::batch_partial_failure,
                             "entry " + std::to_string(k) + " failed: " + reply.entries[k]->error);
    } else if (std::string problem = validate_reply(*reply.entries[k]); !problem.empty()) {
      failure = make_failure(m.task_id, ErrorCode::batch_partial_failure,
                             "entry " + std::to_string(k) + " malformed: " + problem);
    }

    if (failure) {
      pool_.metrics_.record_failed();
      pool_.publish_failure(PoolEventType::failed, task, *failure);
      out[m.index] = std::move(*failure);
      continue;
    }

    SubmitOutcome ok;
    ok.ok = true;
    ok.task_id = m.task_id;
    ok.result = build_result(m.task_id, spec.hypothesis_id, tier, *reply.entries[k], per_entry_ms);
    if (pool_.cache_) pool_.cache_->put(m.fingerprint, ok.result);
    pool_.metrics_.record_completed(per_entry_ms, tier.cost_per_task);

    PoolEvent ev;
    ev.type = PoolEventType::completed;
    ev.task_id = m.task_id;
    ev.hypothesis_id = spec.hypothesis_id;
    ev.tier = tier.tier;
    ev.result = ok.result;
    pool_.events_.publish(std::move(ev));
    out[m.index] = std::move(ok);
  }
}

}  // namespace tierpool
