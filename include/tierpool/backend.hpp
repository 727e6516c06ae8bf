#pragma once

// tierpool/backend.hpp: Remote execution handle interface.
//
// DESIGN INVARIANTS (every implementation):
//   1. execute_single() eventually returns. Transport, auth and retry belong to
//      the implementation; the pool never retries.
//   2. execute_batch() returns entries in input order. An entry may be absent
//      (short reply) or malformed; the pool attributes that to the one
//      sub-request, never to the whole batch.
//   3. Failure is reported either as ok == false with an error message or by
//      throwing a std::exception. Both become execution_failure.
//
// Thread-safety: implementations MUST be safe for concurrent calls. The
// executor runs up to max_concurrency calls per tier at once.
//
// EXTENSION_POINT: remote_gpu_backend
//   Implement IExecutionBackend over an HTTP broker client. Keep supports_batch()
//   truthful: the batch coordinator relies on it to choose the bulk path.

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "tierpool/types.hpp"

namespace tierpool {

struct BackendReply {
  bool ok{false};
  std::string error;
  bool physics_valid{false};
  bool economically_viable{false};
  double confidence_score{0.0};
  std::map<std::string, MetricInterval> metrics;
};

struct BatchItem {
  std::string hypothesis_id;
  ValidationRequest request;
};

struct BatchReply {
  bool ok{false};
  std::string error;                       // whole-call failure
  std::vector<std::optional<BackendReply>> entries;
};

// Returns "" when the reply is well-formed, otherwise a description.
std::string validate_reply(const BackendReply& reply);

class IExecutionBackend {
 public:
  virtual ~IExecutionBackend() = default;

  virtual BackendReply execute_single(const std::string& hypothesis_id,
                                      const ValidationRequest& request) = 0;

  virtual bool supports_batch(RequestKind kind) const = 0;

  // All items share one request kind.
  virtual BatchReply execute_batch(RequestKind kind, const std::vector<BatchItem>& items) = 0;

  // Health probe. Used by warm_up() and, in fail-fast mode, by submit().
  virtual bool is_available() const = 0;

  virtual std::string backend_id() const = 0;
};

// ---------------------------------------------------------------------------
// SimulatedBackend: deterministic in-process Monte Carlo
// ---------------------------------------------------------------------------
// Model (per sample):
//   efficiency ~ N(efficiency_mean, efficiency_std) clipped to [0.01, 0.99]
//   cost       ~ N(cost_mean, cost_std)             clipped to >= 1
//   lcoe = cost * 1000 / (capacity_kw * capacity_factor * 8760 * efficiency * lifetime_years)
// Verdicts:
//   physics_valid       iff 0.05 <= mean(efficiency) <= theoretical_max_efficiency
//   economically_viable iff median(lcoe) <= target_lcoe
//   confidence          = clamp(1 - std(lcoe) / mean(lcoe), 0, 1)
//
// The RNG (mt19937_64) is seeded from BLAKE3("sim:" || hypothesis || request),
// so the single and bulk paths produce identical replies for identical input.
struct SimulationOptions {
  std::uint64_t latency_ms{0};        // artificial per-call latency
  std::uint64_t quick_iterations{10000};
  std::uint64_t full_iterations{100000};
  std::uint64_t sweep_point_iterations{2000};
  std::uint64_t max_iterations{1000000};
  bool batch_enabled{true};
};

class SimulatedBackend : public IExecutionBackend {
 public:
  explicit SimulatedBackend(Tier tier, SimulationOptions options = {});

  BackendReply execute_single(const std::string& hypothesis_id,
                              const ValidationRequest& request) override;
  bool supports_batch(RequestKind kind) const override;
  BatchReply execute_batch(RequestKind kind, const std::vector<BatchItem>& items) override;
  bool is_available() const override { return true; }
  std::string backend_id() const override { return "simulated:" + to_string(tier_); }

  std::uint64_t single_calls() const;
  std::uint64_t batch_calls() const;

 private:
  BackendReply simulate(const std::string& hypothesis_id, const ValidationRequest& request) const;

  Tier tier_;
  SimulationOptions options_;
  mutable std::mutex mu_;
  std::uint64_t single_calls_{0};
  std::uint64_t batch_calls_{0};
};

}  // namespace tierpool
