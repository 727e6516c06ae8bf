#include "tierpool/fingerprint.hpp"

#include "tierpool/hash.hpp"

namespace tierpool {

namespace {

// Kind-specific fields merged into the canonical object alongside "parameters".
void add_request_fields(jsonlite::Object& doc, const ValidationRequest& request) {
  doc["kind"] = jsonlite::Value{to_string(request_kind(request))};
  doc["parameters"] = jsonlite::Value{request_parameters(request)};
  if (const auto* mc = std::get_if<MonteCarloRequest>(&request)) {
    doc["iterations"] = jsonlite::Value{static_cast<std::uint64_t>(mc->iterations)};
  } else if (const auto* sweep = std::get_if<ParametricSweepRequest>(&request)) {
    jsonlite::Array values;
    values.reserve(sweep->sweep_values.size());
    for (double v : sweep->sweep_values) values.push_back(jsonlite::Value{v});
    doc["sweep_key"] = jsonlite::Value{sweep->sweep_key};
    doc["sweep_values"] = jsonlite::Value{std::move(values)};
  } else if (const auto* phys = std::get_if<PhysicsValidationRequest>(&request)) {
    doc["fidelity"] = jsonlite::Value{phys->fidelity};
  }
}

}  // namespace

std::string canonicalize_request(const ValidationRequest& request) {
  jsonlite::Object doc;
  add_request_fields(doc, request);
  return jsonlite::to_json(doc);
}

std::string canonicalize_task(const std::string& hypothesis_id, Tier tier,
                              const ValidationRequest& request) {
  jsonlite::Object doc;
  doc["hypothesis_id"] = jsonlite::Value{hypothesis_id};
  doc["tier"] = jsonlite::Value{to_string(tier)};
  add_request_fields(doc, request);
  return jsonlite::to_json(doc);
}

std::string canonicalize_task(const TaskSpec& spec) {
  return canonicalize_task(spec.hypothesis_id, spec.tier, spec.request);
}

std::string compute_fingerprint(const std::string& hypothesis_id, Tier tier,
                                const ValidationRequest& request) {
  return hash_domain("vfp:", canonicalize_task(hypothesis_id, tier, request));
}

std::string compute_fingerprint(const TaskSpec& spec) {
  return compute_fingerprint(spec.hypothesis_id, spec.tier, spec.request);
}

}  // namespace tierpool
