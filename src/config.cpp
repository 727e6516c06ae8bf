#include "tierpool/config.hpp"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <set>
#include <type_traits>
#include <utility>

#include "tierpool/observability.hpp"
#include "tierpool/version.hpp"

namespace tierpool {

namespace {

const std::set<std::string>& known_keys() {
  static const std::set<std::string> keys{
      "max_concurrency",  "queue_timeout_ms",    "caller_timeout_margin_ms",
      "enable_cache",     "cache_ttl_ms",        "cache_max_entries",
      "cache_eviction",   "tick_interval_ms",    "utilization_history",
      "fail_fast_unavailable", "dedupe_inflight", "executor_threads",
      "event_log_path",   "config_version",
  };
  return keys;
}

bool is_u64(const jsonlite::Value& v) { return std::holds_alternative<std::uint64_t>(v.v); }

// Applies recognised keys; type mismatches are recorded as errors.
void overlay(const jsonlite::Object& doc, PoolConfig& cfg, std::vector<std::string>& errors) {
  auto u64_field = [&](const char* key, auto& target) {
    auto it = doc.find(key);
    if (it == doc.end()) return;
    if (!is_u64(it->second)) {
      errors.push_back(std::string(key) + " must be a non-negative integer");
      return;
    }
    target = static_cast<std::remove_reference_t<decltype(target)>>(
        std::get<std::uint64_t>(it->second.v));
  };
  auto bool_field = [&](const char* key, bool& target) {
    auto it = doc.find(key);
    if (it == doc.end()) return;
    if (!std::holds_alternative<bool>(it->second.v)) {
      errors.push_back(std::string(key) + " must be a boolean");
      return;
    }
    target = std::get<bool>(it->second.v);
  };

  if (auto it = doc.find("max_concurrency"); it != doc.end()) {
    if (const auto* per_tier = std::get_if<jsonlite::Object>(&it->second.v)) {
      for (const auto& [name, value] : *per_tier) {
        const auto tier = parse_tier(name);
        if (!tier) {
          errors.push_back("max_concurrency: unknown tier '" + name + "'");
          continue;
        }
        if (!is_u64(value)) {
          errors.push_back("max_concurrency." + name + " must be a non-negative integer");
          continue;
        }
        cfg.max_concurrency[tier_index(*tier)] =
            static_cast<std::size_t>(std::get<std::uint64_t>(value.v));
      }
    } else {
      errors.push_back("max_concurrency must be an object keyed by tier");
    }
  }

  u64_field("queue_timeout_ms", cfg.queue_timeout_ms);
  u64_field("caller_timeout_margin_ms", cfg.caller_timeout_margin_ms);
  bool_field("enable_cache", cfg.enable_cache);
  u64_field("cache_ttl_ms", cfg.cache_ttl_ms);
  u64_field("cache_max_entries", cfg.cache_max_entries);
  u64_field("tick_interval_ms", cfg.tick_interval_ms);
  u64_field("utilization_history", cfg.utilization_history);
  bool_field("fail_fast_unavailable", cfg.fail_fast_unavailable);
  bool_field("dedupe_inflight", cfg.dedupe_inflight);
  u64_field("executor_threads", cfg.executor_threads);

  if (auto it = doc.find("cache_eviction"); it != doc.end()) {
    const auto* s = std::get_if<std::string>(&it->second.v);
    const auto policy = s ? parse_eviction_policy(*s) : std::nullopt;
    if (policy) {
      cfg.cache_eviction = *policy;
    } else {
      errors.push_back("cache_eviction must be \"insertion_order\" or \"least_recently_used\"");
    }
  }
  if (auto it = doc.find("event_log_path"); it != doc.end()) {
    if (const auto* s = std::get_if<std::string>(&it->second.v)) {
      cfg.event_log_path = *s;
    } else {
      errors.push_back("event_log_path must be a string");
    }
  }
}

std::optional<std::uint64_t> env_u64(const char* name) {
  const char* e = std::getenv(name);
  if (!e || !e[0]) return std::nullopt;
  char* end = nullptr;
  errno = 0;
  const unsigned long long v = std::strtoull(e, &end, 10);
  if (errno != 0 || end == e || *end != '\0' || e[0] == '-') {
    log_line(std::string("ignoring malformed ") + name + "=" + e);
    return std::nullopt;
  }
  return static_cast<std::uint64_t>(v);
}

}  // namespace

std::vector<std::string> check_config(const PoolConfig& cfg) {
  std::vector<std::string> errors;
  for (Tier t : kAllTiers) {
    if (cfg.max_concurrency_for(t) == 0) {
      errors.push_back("max_concurrency." + to_string(t) + " must be > 0");
    }
  }
  if (cfg.tick_interval_ms == 0) errors.push_back("tick_interval_ms must be > 0");

  const std::pair<const char*, std::uint64_t> durations[] = {
      {"queue_timeout_ms", cfg.queue_timeout_ms},
      {"caller_timeout_margin_ms", cfg.caller_timeout_margin_ms},
      {"cache_ttl_ms", cfg.cache_ttl_ms},
      {"tick_interval_ms", cfg.tick_interval_ms},
  };
  for (const auto& [key, value] : durations) {
    if (value > kMaxDurationMs) {
      errors.push_back(std::string(key) + " must be <= " + std::to_string(kMaxDurationMs));
    }
  }

  std::size_t slots = 0;
  for (std::size_t c : cfg.max_concurrency) slots += c;
  if (cfg.executor_threads > 0 && cfg.executor_threads < slots) {
    errors.push_back("executor_threads must be 0 or >= the sum of max_concurrency (" +
                     std::to_string(slots) + ")");
  }
  if (cfg.enable_cache && cfg.cache_max_entries == 0) {
    errors.push_back("cache_max_entries must be > 0 when enable_cache is true");
  }
  return errors;
}

ConfigValidationResult validate_config(const std::string& config_json) {
  ConfigValidationResult r;
  r.config_version = std::to_string(version::CONFIG_SCHEMA_VERSION);

  std::optional<jsonlite::JsonError> err;
  const jsonlite::Object doc = jsonlite::parse(config_json, &err);
  if (err) {
    r.errors.push_back(err->code + ": " + err->message);
    return r;
  }

  for (const auto& [key, value] : doc) {
    if (!known_keys().contains(key)) r.warnings.push_back("unknown key: " + key);
  }
  if (auto it = doc.find("config_version"); it != doc.end()) {
    if (const auto* v = std::get_if<std::uint64_t>(&it->second.v)) {
      if (*v != version::CONFIG_SCHEMA_VERSION) {
        r.warnings.push_back("config_version " + std::to_string(*v) + " differs from supported " +
                             r.config_version);
      }
    }
  }

  PoolConfig cfg;
  overlay(doc, cfg, r.errors);
  for (auto& e : check_config(cfg)) r.errors.push_back(std::move(e));
  if (cfg.queue_timeout_ms == 0) r.warnings.push_back("queue_timeout_ms is 0: every queued task times out");
  if (cfg.tick_interval_ms > 1000) r.warnings.push_back("tick_interval_ms above 1000 delays admission");

  r.ok = r.errors.empty();
  return r;
}

std::optional<PoolConfig> parse_config_json(const std::string& config_json, const PoolConfig& base,
                                            std::vector<std::string>* errors) {
  std::vector<std::string> errs;
  std::optional<jsonlite::JsonError> err;
  const jsonlite::Object doc = jsonlite::parse(config_json, &err);
  if (err) {
    errs.push_back(err->code + ": " + err->message);
  }
  PoolConfig cfg = base;
  if (!err) {
    overlay(doc, cfg, errs);
    for (auto& e : check_config(cfg)) errs.push_back(std::move(e));
  }
  if (!errs.empty()) {
    if (errors) *errors = std::move(errs);
    return std::nullopt;
  }
  return cfg;
}

void apply_env_overrides(PoolConfig& cfg) {
  if (auto v = env_u64("TIERPOOL_QUEUE_TIMEOUT_MS")) cfg.queue_timeout_ms = *v;
  if (auto v = env_u64("TIERPOOL_TICK_MS"); v && *v > 0) cfg.tick_interval_ms = *v;
  if (auto v = env_u64("TIERPOOL_CACHE_TTL_MS")) cfg.cache_ttl_ms = *v;
  if (auto v = env_u64("TIERPOOL_CACHE_MAX"); v && *v > 0) cfg.cache_max_entries = static_cast<std::size_t>(*v);
  if (const char* e = std::getenv("TIERPOOL_CACHE"); e && e[0]) {
    const std::string s(e);
    if (s == "0" || s == "false") cfg.enable_cache = false;
    else if (s == "1" || s == "true") cfg.enable_cache = true;
    else log_line("ignoring malformed TIERPOOL_CACHE=" + s);
  }
}

std::optional<PoolConfig> load_config(const std::string& path, std::vector<std::string>* errors) {
  PoolConfig cfg;
  if (!path.empty()) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
      if (errors) *errors = {"cannot open config file: " + path};
      return std::nullopt;
    }
    const std::string text((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    auto parsed = parse_config_json(text, cfg, errors);
    if (!parsed) return std::nullopt;
    cfg = *parsed;
  }
  apply_env_overrides(cfg);
  if (auto errs = check_config(cfg); !errs.empty()) {
    if (errors) *errors = std::move(errs);
    return std::nullopt;
  }
  return cfg;
}

std::string config_to_json(const PoolConfig& cfg) {
  std::string out = "{\"max_concurrency\":{";
  bool first = true;
  for (Tier t : kAllTiers) {
    if (!first) out += ',';
    first = false;
    out += "\"" + to_string(t) + "\":" + std::to_string(cfg.max_concurrency_for(t));
  }
  out += "},\"queue_timeout_ms\":" + std::to_string(cfg.queue_timeout_ms);
  out += ",\"caller_timeout_margin_ms\":" + std::to_string(cfg.caller_timeout_margin_ms);
  out += std::string(",\"enable_cache\":") + (cfg.enable_cache ? "true" : "false");
  out += ",\"cache_ttl_ms\":" + std::to_string(cfg.cache_ttl_ms);
  out += ",\"cache_max_entries\":" + std::to_string(cfg.cache_max_entries);
  out += ",\"cache_eviction\":\"" + to_string(cfg.cache_eviction) + "\"";
  out += ",\"tick_interval_ms\":" + std::to_string(cfg.tick_interval_ms);
  out += ",\"utilization_history\":" + std::to_string(cfg.utilization_history);
  out += std::string(",\"fail_fast_unavailable\":") + (cfg.fail_fast_unavailable ? "true" : "false");
  out += std::string(",\"dedupe_inflight\":") + (cfg.dedupe_inflight ? "true" : "false");
  out += ",\"executor_threads\":" + std::to_string(cfg.executor_threads);
  out += ",\"event_log_path\":\"" + jsonlite::escape(cfg.event_log_path) + "\"}";
  return out;
}

}  // namespace tierpool
