#include "tierpool/types.hpp"

#include <sstream>

namespace tierpool {

std::string to_string(Tier t) {
  switch (t) {
    case Tier::t4:   return "t4";
    case Tier::a10g: return "a10g";
    case Tier::a100: return "a100";
  }
  return "t4";
}

std::optional<Tier> parse_tier(const std::string& s) {
  if (s == "t4" || s == "T4" || s == "low") return Tier::t4;
  if (s == "a10g" || s == "A10G" || s == "mid") return Tier::a10g;
  if (s == "a100" || s == "A100" || s == "high") return Tier::a100;
  return std::nullopt;
}

std::string to_string(Priority p) {
  switch (p) {
    case Priority::critical: return "critical";
    case Priority::high:     return "high";
    case Priority::normal:   return "normal";
    case Priority::low:      return "low";
  }
  return "normal";
}

std::optional<Priority> parse_priority(const std::string& s) {
  if (s == "critical") return Priority::critical;
  if (s == "high") return Priority::high;
  if (s == "normal") return Priority::normal;
  if (s == "low") return Priority::low;
  return std::nullopt;
}

std::string to_string(RequestKind k) {
  switch (k) {
    case RequestKind::monte_carlo:        return "monte_carlo";
    case RequestKind::parametric_sweep:   return "parametric_sweep";
    case RequestKind::physics_validation: return "physics_validation";
    case RequestKind::batch_validation:   return "batch_validation";
  }
  return "physics_validation";
}

std::optional<RequestKind> parse_request_kind(const std::string& s) {
  if (s == "monte_carlo") return RequestKind::monte_carlo;
  if (s == "parametric_sweep") return RequestKind::parametric_sweep;
  if (s == "physics_validation") return RequestKind::physics_validation;
  if (s == "batch_validation") return RequestKind::batch_validation;
  return std::nullopt;
}

std::string to_string(TaskStatus s) {
  switch (s) {
    case TaskStatus::queued:    return "queued";
    case TaskStatus::running:   return "running";
    case TaskStatus::completed: return "completed";
    case TaskStatus::failed:    return "failed";
    case TaskStatus::cancelled: return "cancelled";
  }
  return "queued";
}

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none:                  return "";
    case ErrorCode::queue_timeout:         return "queue_timeout";
    case ErrorCode::execution_failure:     return "execution_failure";
    case ErrorCode::batch_partial_failure: return "batch_partial_failure";
    case ErrorCode::pool_unavailable:      return "pool_unavailable";
    case ErrorCode::cancelled:             return "cancelled";
    case ErrorCode::caller_timeout:        return "caller_timeout";
    case ErrorCode::pool_stopped:          return "pool_stopped";
    case ErrorCode::invalid_request:       return "invalid_request";
    case ErrorCode::queues_cleared:        return "queues_cleared";
  }
  return "";
}

namespace {

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

}  // namespace

RequestKind request_kind(const ValidationRequest& request) {
  return std::visit(overloaded{
      [](const MonteCarloRequest&) { return RequestKind::monte_carlo; },
      [](const ParametricSweepRequest&) { return RequestKind::parametric_sweep; },
      [](const PhysicsValidationRequest&) { return RequestKind::physics_validation; },
      [](const BatchValidationRequest&) { return RequestKind::batch_validation; },
  }, request);
}

const jsonlite::Object& request_parameters(const ValidationRequest& request) {
  return std::visit([](const auto& r) -> const jsonlite::Object& { return r.parameters; }, request);
}

std::optional<TaskSpec> task_spec_from_json(const jsonlite::Object& obj, std::string* error) {
  auto set_error = [error](const std::string& msg) {
    if (error) *error = msg;
    return std::nullopt;
  };

  TaskSpec spec;
  spec.hypothesis_id = jsonlite::get_string(obj, "hypothesis_id");
  if (spec.hypothesis_id.empty()) return set_error("missing hypothesis_id");

  const auto tier = parse_tier(jsonlite::get_string(obj, "tier", "t4"));
  if (!tier) return set_error("unknown tier: " + jsonlite::get_string(obj, "tier"));
  spec.tier = *tier;

  const auto priority = parse_priority(jsonlite::get_string(obj, "priority", "normal"));
  if (!priority) return set_error("unknown priority: " + jsonlite::get_string(obj, "priority"));
  spec.priority = *priority;

  const auto kind = parse_request_kind(jsonlite::get_string(obj, "kind", "physics_validation"));
  if (!kind) return set_error("unknown kind: " + jsonlite::get_string(obj, "kind"));

  jsonlite::Object params = jsonlite::get_object(obj, "parameters");
  switch (*kind) {
    case RequestKind::monte_carlo:
      spec.request = MonteCarloRequest{std::move(params), jsonlite::get_u64(obj, "iterations", 10000)};
      break;
    case RequestKind::parametric_sweep: {
      ParametricSweepRequest sweep;
      sweep.parameters = std::move(params);
      sweep.sweep_key = jsonlite::get_string(obj, "sweep_key");
      sweep.sweep_values = jsonlite::get_double_array(obj, "sweep_values");
      if (sweep.sweep_key.empty() || sweep.sweep_values.empty()) {
        return set_error("parametric_sweep requires sweep_key and sweep_values");
      }
      spec.request = std::move(sweep);
      break;
    }
    case RequestKind::physics_validation: {
      const std::string fidelity = jsonlite::get_string(obj, "fidelity", "quick");
      if (fidelity != "quick" && fidelity != "full") return set_error("unknown fidelity: " + fidelity);
      spec.request = PhysicsValidationRequest{std::move(params), fidelity};
      break;
    }
    case RequestKind::batch_validation:
      spec.request = BatchValidationRequest{std::move(params)};
      break;
  }
  return spec;
}

SubmitOutcome make_failure(const std::string& task_id, ErrorCode code, std::string detail) {
  SubmitOutcome o;
  o.ok = false;
  o.error_code = code;
  o.error_detail = std::move(detail);
  o.task_id = task_id;
  return o;
}

std::string result_to_json(const ValidationResult& r) {
  std::ostringstream o;
  o << "{\"task_id\":\"" << jsonlite::escape(r.task_id) << "\""
    << ",\"hypothesis_id\":\"" << jsonlite::escape(r.hypothesis_id) << "\""
    << ",\"tier\":\"" << to_string(r.tier) << "\""
    << ",\"physics_valid\":" << (r.physics_valid ? "true" : "false")
    << ",\"economically_viable\":" << (r.economically_viable ? "true" : "false")
    << ",\"confidence_score\":" << jsonlite::format_double(r.confidence_score)
    << ",\"metrics\":{";
  bool first = true;
  for (const auto& [name, m] : r.metrics) {
    if (!first) o << ",";
    first = false;
    o << "\"" << jsonlite::escape(name) << "\":{\"mean\":" << jsonlite::format_double(m.mean)
      << ",\"ci95\":[" << jsonlite::format_double(m.ci95_low) << ","
      << jsonlite::format_double(m.ci95_high) << "]}";
  }
  o << "},\"duration_ms\":" << jsonlite::format_double(r.duration_ms)
    << ",\"cost\":" << jsonlite::format_double(r.cost)
    << ",\"from_cache\":" << (r.from_cache ? "true" : "false")
    << "}";
  return o.str();
}

std::string outcome_to_json(const SubmitOutcome& out) {
  std::string s = "{\"ok\":";
  s += out.ok ? "true" : "false";
  s += ",\"task_id\":\"" + jsonlite::escape(out.task_id) + "\"";
  if (out.ok) {
    s += ",\"result\":" + result_to_json(out.result);
  } else {
    s += ",\"error_code\":\"" + to_string(out.error_code) + "\"";
    s += ",\"error\":\"" + jsonlite::escape(out.error_detail) + "\"";
  }
  s += "}";
  return s;
}

std::uint64_t unix_time_ms() {
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

}  // namespace tierpool
