#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "tierpool/backend.hpp"
#include "tierpool/config.hpp"
#include "tierpool/escalation.hpp"
#include "tierpool/hash.hpp"
#include "tierpool/jsonlite.hpp"
#include "tierpool/pool.hpp"
#include "tierpool/tier_registry.hpp"
#include "tierpool/version.hpp"

namespace {

bool read_file(const std::string &path, std::string *out) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs)
    return false;
  *out = std::string((std::istreambuf_iterator<char>(ifs)),
                     std::istreambuf_iterator<char>());
  return true;
}

int fail_json(const std::string &message, int code = 2) {
  std::cerr << "{\"error\":\"" << tierpool::jsonlite::escape(message)
            << "\"}\n";
  return code;
}

std::string arg_value(int argc, char **argv, int from, const std::string &flag) {
  for (int i = from; i < argc; ++i) {
    if (std::string(argv[i]) == flag && i + 1 < argc)
      return argv[i + 1];
  }
  return {};
}

bool has_flag(int argc, char **argv, int from, const std::string &flag) {
  for (int i = from; i < argc; ++i) {
    if (std::string(argv[i]) == flag)
      return true;
  }
  return false;
}

// Tasks file: a JSON array of task spec objects (see types.hpp).
bool load_tasks(const std::string &path, std::vector<tierpool::TaskSpec> *out,
                std::string *error) {
  std::string text;
  if (!read_file(path, &text)) {
    *error = "cannot open tasks file: " + path;
    return false;
  }
  std::optional<tierpool::jsonlite::JsonError> err;
  const auto doc = tierpool::jsonlite::parse_value(text, &err);
  if (err) {
    *error = err->code + ": " + err->message;
    return false;
  }
  const auto *items = std::get_if<tierpool::jsonlite::Array>(&doc.v);
  if (!items) {
    *error = "tasks file must contain a JSON array";
    return false;
  }
  for (std::size_t i = 0; i < items->size(); ++i) {
    const auto *obj = std::get_if<tierpool::jsonlite::Object>(&(*items)[i].v);
    if (!obj) {
      *error = "task " + std::to_string(i) + " is not an object";
      return false;
    }
    std::string spec_error;
    auto spec = tierpool::task_spec_from_json(*obj, &spec_error);
    if (!spec) {
      *error = "task " + std::to_string(i) + ": " + spec_error;
      return false;
    }
    out->push_back(std::move(*spec));
  }
  return true;
}

int cmd_run(int argc, char **argv) {
  const std::string tasks_path = arg_value(argc, argv, 2, "--tasks");
  if (tasks_path.empty())
    return fail_json("run requires --tasks <file>");

  std::vector<std::string> config_errors;
  auto cfg = tierpool::load_config(arg_value(argc, argv, 2, "--config"),
                                   &config_errors);
  if (!cfg) {
    std::string joined;
    for (const auto &e : config_errors)
      joined += (joined.empty() ? "" : "; ") + e;
    return fail_json("invalid config: " + joined);
  }

  std::vector<tierpool::TaskSpec> specs;
  std::string error;
  if (!load_tasks(tasks_path, &specs, &error))
    return fail_json(error);

  tierpool::SimulationOptions sim;
  if (const char *latency = std::getenv("TIERPOOL_SIM_LATENCY_MS");
      latency && latency[0]) {
    char *end = nullptr;
    errno = 0;
    const unsigned long long v = std::strtoull(latency, &end, 10);
    if (errno == 0 && end && *end == '\0')
      sim.latency_ms = v;
  }

  auto registry = tierpool::TierRegistry::from_config(
      *cfg, [&sim](tierpool::Tier t) {
        return std::make_shared<tierpool::SimulatedBackend>(t, sim);
      });
  tierpool::ValidationPool pool(*cfg, std::move(registry));
  pool.start();

  std::vector<tierpool::SubmitOutcome> outcomes;
  if (has_flag(argc, argv, 2, "--batch")) {
    outcomes = pool.submit_batch(specs);
  } else {
    std::vector<tierpool::SubmitHandle> handles;
    handles.reserve(specs.size());
    for (const auto &s : specs)
      handles.push_back(pool.submit_async(s));
    for (auto &h : handles)
      outcomes.push_back(h.result.get());
  }

  int failed = 0;
  for (const auto &o : outcomes) {
    if (!o.ok)
      ++failed;
    std::cout << tierpool::outcome_to_json(o) << "\n";
  }
  std::cout << "{\"metrics\":" << tierpool::metrics_to_json(pool.metrics())
            << ",\"utilization\":"
            << tierpool::utilization_to_json(pool.utilization()) << "}\n";
  pool.stop();
  return failed == 0 ? 0 : 1;
}

} // namespace

int main(int argc, char **argv) {
  std::string cmd;
  for (int i = 1; i < argc; ++i) {
    if (std::string(argv[i]).rfind("--", 0) == 0)
      continue;
    cmd = argv[i];
    break;
  }
  if (cmd.empty()) {
    std::cerr << "usage: tierpool <version|health|config check|run|select-tier> "
                 "[options]\n";
    return 1;
  }

  if (cmd == "version") {
    std::cout << tierpool::version::manifest_to_json(
                     tierpool::version::current_manifest())
              << "\n";
    return 0;
  }

  if (cmd == "health") {
    const auto h = tierpool::hash_runtime_info();
    std::cout << "{\"hash_primitive\":\"" << h.primitive
              << "\",\"hash_version\":\"" << h.version
              << "\",\"fingerprint_schema\":"
              << tierpool::version::FINGERPRINT_SCHEMA_VERSION << "}\n";
    return 0;
  }

  if (cmd == "config" && argc >= 3 && std::string(argv[2]) == "check") {
    const std::string path = arg_value(argc, argv, 3, "--config");
    if (path.empty())
      return fail_json("config check requires --config <file>");
    std::string text;
    if (!read_file(path, &text))
      return fail_json("cannot open config file: " + path);
    const auto r = tierpool::validate_config(text);
    std::ostringstream o;
    o << "{\"ok\":" << (r.ok ? "true" : "false") << ",\"config_version\":\""
      << r.config_version << "\",\"errors\":[";
    for (std::size_t i = 0; i < r.errors.size(); ++i)
      o << (i ? "," : "") << "\"" << tierpool::jsonlite::escape(r.errors[i])
        << "\"";
    o << "],\"warnings\":[";
    for (std::size_t i = 0; i < r.warnings.size(); ++i)
      o << (i ? "," : "") << "\"" << tierpool::jsonlite::escape(r.warnings[i])
        << "\"";
    o << "]}";
    std::cout << o.str() << "\n";
    return r.ok ? 0 : 2;
  }

  if (cmd == "run") {
    return cmd_run(argc, argv);
  }

  if (cmd == "select-tier") {
    const std::string score_arg = arg_value(argc, argv, 2, "--score");
    char *end = nullptr;
    errno = 0;
    const double score = std::strtod(score_arg.c_str(), &end);
    if (score_arg.empty() || errno != 0 || !end || *end != '\0')
      return fail_json("select-tier requires a numeric --score");
    const auto tier = tierpool::select_tier_by_score(score);
    const auto escalated = tierpool::escalate_tier(tier);
    std::cout << "{\"score\":" << tierpool::jsonlite::format_double(score)
              << ",\"tier\":\"" << tierpool::to_string(tier)
              << "\",\"priority\":\""
              << tierpool::to_string(tierpool::select_priority_by_score(score))
              << "\",\"escalation\":"
              << (escalated ? "\"" + tierpool::to_string(*escalated) + "\""
                            : std::string("null"))
              << "}\n";
    return 0;
  }

  return fail_json("unknown command: " + cmd, 1);
}
