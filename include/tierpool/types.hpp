#pragma once

// tierpool/types.hpp: Core data structures for the tiered validation pool.
//
// OWNERSHIP:
//   - TaskSpec, Task, ValidationResult and SubmitOutcome are value types. All
//     string and map members are value-owned; no borrowed references escape.
//   - While a Task is queued or running, the pool's scheduler state owns it
//     (priority_queue.hpp / pool.hpp). Once terminal it is copied into the
//     completion event and never mutated again.
//
// REQUEST KINDS:
//   ValidationRequest is a closed std::variant, one alternative per request
//   kind, each carrying its own parameter shape. Dispatch on kind goes through
//   std::visit so a new alternative fails to compile wherever it is unhandled.
//
// EXTENSION_POINT: additional_request_kinds
//   Add a struct, append it to the variant, extend RequestKind and the
//   kind-specific canonical fields in fingerprint.cpp. Appending a kind does not
//   change fingerprints of existing kinds.

#include <array>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "tierpool/jsonlite.hpp"

namespace tierpool {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

// Upper bound for every configured duration (ten years). Keeps ms -> ns
// conversions, timeout sums and `now - timeout` inside Clock::rep.
constexpr std::uint64_t kMaxDurationMs = 315360000000ULL;

constexpr std::chrono::milliseconds bounded_ms(std::uint64_t ms) {
  return std::chrono::milliseconds(static_cast<std::int64_t>(ms < kMaxDurationMs ? ms : kMaxDurationMs));
}

// ---------------------------------------------------------------------------
// Tier: class of remote compute capability (low / mid / high).
// ---------------------------------------------------------------------------
enum class Tier { t4, a10g, a100 };

constexpr std::size_t kTierCount = 3;
constexpr std::array<Tier, kTierCount> kAllTiers{Tier::t4, Tier::a10g, Tier::a100};

constexpr std::size_t tier_index(Tier t) { return static_cast<std::size_t>(t); }
std::string to_string(Tier t);
std::optional<Tier> parse_tier(const std::string& s);

// Lower rank is served first.
enum class Priority { critical = 0, high = 1, normal = 2, low = 3 };

constexpr int priority_rank(Priority p) { return static_cast<int>(p); }
std::string to_string(Priority p);
std::optional<Priority> parse_priority(const std::string& s);

enum class RequestKind { monte_carlo, parametric_sweep, physics_validation, batch_validation };

std::string to_string(RequestKind k);
std::optional<RequestKind> parse_request_kind(const std::string& s);

// queued -> running -> {completed | failed | cancelled}; queued -> failed on queue timeout.
enum class TaskStatus { queued, running, completed, failed, cancelled };

std::string to_string(TaskStatus s);

enum class ErrorCode {
  none,
  queue_timeout,          // waited past queue_timeout_ms, never executed
  execution_failure,      // backend error reply, thrown error, or malformed reply
  batch_partial_failure,  // one entry of a bulk reply missing or malformed
  pool_unavailable,       // backend health probe failed (fail-fast mode only)
  cancelled,              // removed from its queue by cancel()
  caller_timeout,         // caller stopped waiting before a terminal event
  pool_stopped,           // pool destroyed while the task was still queued
  invalid_request,        // unknown tier or malformed task spec
  queues_cleared,         // removed from its queue by clear_queues()
};

std::string to_string(ErrorCode code);

// ---------------------------------------------------------------------------
// Request kinds
// ---------------------------------------------------------------------------
struct MonteCarloRequest {
  jsonlite::Object parameters;
  std::uint64_t iterations{10000};
};

struct ParametricSweepRequest {
  jsonlite::Object parameters;
  std::string sweep_key;             // parameter overridden at each sweep point
  std::vector<double> sweep_values;
};

struct PhysicsValidationRequest {
  jsonlite::Object parameters;
  std::string fidelity{"quick"};     // "quick" | "full"
};

struct BatchValidationRequest {
  jsonlite::Object parameters;
};

using ValidationRequest = std::variant<MonteCarloRequest, ParametricSweepRequest,
                                       PhysicsValidationRequest, BatchValidationRequest>;

RequestKind request_kind(const ValidationRequest& request);
const jsonlite::Object& request_parameters(const ValidationRequest& request);

// ---------------------------------------------------------------------------
// TaskSpec: what a caller submits.
// ---------------------------------------------------------------------------
struct TaskSpec {
  std::string hypothesis_id;
  Tier tier{Tier::t4};
  Priority priority{Priority::normal};
  ValidationRequest request;
};

// Parse one task spec object:
//   {"hypothesis_id":"h1","tier":"t4","priority":"high","kind":"physics_validation",
//    "parameters":{...}, "fidelity":"quick" | "iterations":N | "sweep_key":"k","sweep_values":[..]}
// Returns nullopt and sets *error on an unknown tier/priority/kind or missing id.
std::optional<TaskSpec> task_spec_from_json(const jsonlite::Object& obj, std::string* error);

// ---------------------------------------------------------------------------
// Task: a unit of validation work inside the pool.
// ---------------------------------------------------------------------------
struct Task {
  std::string id;
  std::string hypothesis_id;
  Tier tier{Tier::t4};
  Priority priority{Priority::normal};
  ValidationRequest request;
  std::string fingerprint;           // cache key, computed once at submission
  TimePoint created_at{};
  std::optional<TimePoint> started_at;
  std::optional<TimePoint> completed_at;
  TaskStatus status{TaskStatus::queued};
};

// ---------------------------------------------------------------------------
// ValidationResult: outcome of one task. Never mutated after creation.
// ---------------------------------------------------------------------------
struct MetricInterval {
  double mean{0.0};
  double ci95_low{0.0};
  double ci95_high{0.0};
};

struct ValidationResult {
  std::string task_id;
  std::string hypothesis_id;
  Tier tier{Tier::t4};
  bool physics_valid{false};
  bool economically_viable{false};
  double confidence_score{0.0};
  std::map<std::string, MetricInterval> metrics;
  double duration_ms{0.0};
  double cost{0.0};
  bool from_cache{false};
};

// Exactly one per submitted task. ok == true iff error_code == none.
struct SubmitOutcome {
  bool ok{false};
  ErrorCode error_code{ErrorCode::none};
  std::string error_detail;
  std::string task_id;
  ValidationResult result;           // meaningful only when ok
};

SubmitOutcome make_failure(const std::string& task_id, ErrorCode code, std::string detail);

std::string result_to_json(const ValidationResult& r);
std::string outcome_to_json(const SubmitOutcome& o);

// Milliseconds since the Unix epoch (wall clock, for task ids and event stamps only).
std::uint64_t unix_time_ms();

}  // namespace tierpool
