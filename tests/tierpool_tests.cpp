#include <array>
#include <atomic>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "tierpool/backend.hpp"
#include "tierpool/batch.hpp"
#include "tierpool/config.hpp"
#include "tierpool/escalation.hpp"
#include "tierpool/fingerprint.hpp"
#include "tierpool/hash.hpp"
#include "tierpool/jsonlite.hpp"
#include "tierpool/metrics.hpp"
#include "tierpool/observability.hpp"
#include "tierpool/pool.hpp"
#include "tierpool/priority_queue.hpp"
#include "tierpool/result_cache.hpp"
#include "tierpool/tier_registry.hpp"
#include "tierpool/types.hpp"
#include "tierpool/version.hpp"

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

// ============================================================================
// Fixtures
// ============================================================================

// Controllable backend: latency, a gate that holds every call, per-hypothesis
// failure modes, call accounting and a concurrency high-water mark.
// Failure sets and flags are configured before the pool starts.
class FakeBackend : public tierpool::IExecutionBackend {
 public:
  std::chrono::milliseconds latency{0};
  std::atomic<bool> available{true};
  bool batch_supported{true};
  bool drop_last_batch_entry{false};
  bool throw_on_batch{false};
  std::set<std::string> error_hypotheses;   // ok == false
  std::set<std::string> throw_hypotheses;   // throws std::runtime_error
  std::set<std::string> nan_hypotheses;     // malformed reply
  std::set<std::string> foreign_throw_hypotheses;  // throws a non-std type

  tierpool::BackendReply execute_single(const std::string& hypothesis_id,
                                        const tierpool::ValidationRequest& request) override {
    enter(hypothesis_id);
    wait_gate();
    if (latency.count() > 0) std::this_thread::sleep_for(latency);
    leave();
    if (throw_hypotheses.count(hypothesis_id)) throw std::runtime_error("connection reset");
    if (foreign_throw_hypotheses.count(hypothesis_id)) throw 42;
    return reply_for(hypothesis_id, request);
  }

  bool supports_batch(tierpool::RequestKind kind) const override {
    return batch_supported && kind == tierpool::RequestKind::physics_validation;
  }

  tierpool::BatchReply execute_batch(tierpool::RequestKind,
                                     const std::vector<tierpool::BatchItem>& items) override {
    batch_calls.fetch_add(1);
    batch_items.fetch_add(static_cast<int>(items.size()));
    if (throw_on_batch) throw std::runtime_error("bulk endpoint unreachable");
    tierpool::BatchReply r;
    r.ok = true;
    for (const auto& item : items) r.entries.emplace_back(reply_for(item.hypothesis_id, item.request));
    if (drop_last_batch_entry && !r.entries.empty()) r.entries.pop_back();
    return r;
  }

  bool is_available() const override { return available.load(); }
  std::string backend_id() const override { return "fake"; }

  void close_gate() {
    std::lock_guard<std::mutex> lk(gate_mu_);
    gate_open_ = false;
  }
  void open_gate() {
    {
      std::lock_guard<std::mutex> lk(gate_mu_);
      gate_open_ = true;
    }
    gate_cv_.notify_all();
  }

  std::vector<std::string> executed() const {
    std::lock_guard<std::mutex> lk(log_mu_);
    return executed_;
  }

  std::atomic<int> calls{0};
  std::atomic<int> batch_calls{0};
  std::atomic<int> batch_items{0};
  std::atomic<int> active{0};
  std::atomic<int> max_active{0};

 private:
  tierpool::BackendReply reply_for(const std::string& hypothesis_id,
                                   const tierpool::ValidationRequest& request) const {
    tierpool::BackendReply r;
    if (error_hypotheses.count(hypothesis_id)) {
      r.error = "gpu quota exceeded";
      return r;
    }
    r.ok = true;
    r.physics_valid = tierpool::jsonlite::get_bool(tierpool::request_parameters(request), "valid", true);
    r.economically_viable = true;
    r.confidence_score = nan_hypotheses.count(hypothesis_id) ? std::nan("") : 0.92;
    r.metrics["lcoe"] = tierpool::MetricInterval{0.04, 0.03, 0.05};
    return r;
  }

  void enter(const std::string& hypothesis_id) {
    calls.fetch_add(1);
    const int now = active.fetch_add(1) + 1;
    int prev = max_active.load();
    while (now > prev && !max_active.compare_exchange_weak(prev, now)) {
    }
    std::lock_guard<std::mutex> lk(log_mu_);
    executed_.push_back(hypothesis_id);
  }
  void leave() { active.fetch_sub(1); }

  void wait_gate() {
    std::unique_lock<std::mutex> lk(gate_mu_);
    gate_cv_.wait(lk, [this] { return gate_open_; });
  }

  std::mutex gate_mu_;
  std::condition_variable gate_cv_;
  bool gate_open_{true};
  mutable std::mutex log_mu_;
  std::vector<std::string> executed_;
};

tierpool::PoolConfig fast_config() {
  tierpool::PoolConfig cfg;
  cfg.tick_interval_ms = 5;
  cfg.queue_timeout_ms = 5000;
  cfg.caller_timeout_margin_ms = 5000;
  cfg.event_log_path.clear();
  return cfg;
}

tierpool::TierRegistry registry_for(const tierpool::PoolConfig& cfg,
                                    std::shared_ptr<tierpool::IExecutionBackend> backend) {
  return tierpool::TierRegistry::from_config(cfg, [backend](tierpool::Tier) { return backend; });
}

tierpool::TaskSpec physics(const std::string& hyp, tierpool::Tier tier = tierpool::Tier::t4,
                           tierpool::Priority priority = tierpool::Priority::normal,
                           double efficiency = 0.35) {
  tierpool::TaskSpec s;
  s.hypothesis_id = hyp;
  s.tier = tier;
  s.priority = priority;
  tierpool::PhysicsValidationRequest req;
  req.parameters["efficiency_mean"] = tierpool::jsonlite::Value{efficiency};
  req.parameters["cost_mean"] = tierpool::jsonlite::Value{std::uint64_t{100}};
  s.request = req;
  return s;
}

tierpool::Task queued_task(const std::string& id, tierpool::Priority p) {
  tierpool::Task t;
  t.id = id;
  t.hypothesis_id = id;
  t.priority = p;
  t.created_at = tierpool::Clock::now();
  return t;
}

bool wait_ready(const tierpool::SubmitHandle& h, std::chrono::milliseconds limit = 5000ms) {
  return h.result.wait_for(limit) == std::future_status::ready;
}

// ============================================================================
// Hashing, JSON, fingerprints
// ============================================================================

void test_blake3_known_vectors() {
  expect(tierpool::blake3_hex("") == "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(tierpool::blake3_hex("hello") == "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
  expect(tierpool::hash_runtime_info().primitive == "blake3", "primitive must be blake3");
}

void test_domain_separation() {
  const std::string data = "payload";
  const auto vfp = tierpool::hash_domain("vfp:", data);
  const auto sim = tierpool::hash_domain("sim:", data);
  expect(vfp.size() == 64, "domain digest must be 64 hex chars");
  expect(vfp != sim, "vfp and sim domains must differ");
  expect(vfp != tierpool::blake3_hex(data), "domain digest differs from plain digest");
  expect(vfp == tierpool::hash_domain("vfp:", data), "domain hash must be deterministic");

  expect(tierpool::seed_from_hex("00000000000000ff") == 255, "seed parses first 16 hex chars");
  expect(tierpool::seed_from_hex("abc") == 0, "short digest yields 0 seed");
  expect(tierpool::seed_from_hex("zz00000000000000") == 0, "non-hex digest yields 0 seed");
}

void test_jsonlite_strict_and_canonical() {
  std::optional<tierpool::jsonlite::JsonError> err;
  auto obj = tierpool::jsonlite::parse("{\"b\":1,\"a\":[true,null,\"x\"],\"c\":2.5}", &err);
  expect(!err, "valid json parses");
  expect(tierpool::jsonlite::to_json(obj) == "{\"a\":[true,null,\"x\"],\"b\":1,\"c\":2.5}",
         "canonical output sorts keys");

  (void)tierpool::jsonlite::parse("{\"a\":1,\"a\":2}", &err);
  expect(err && err->code == "json_duplicate_key", "duplicate keys rejected");
  expect(tierpool::jsonlite::validate_strict("{\"a\":1} x").has_value(), "trailing data rejected");
  expect(tierpool::jsonlite::validate_strict("{\"a\":NaN}").has_value(), "NaN rejected");

  expect(tierpool::jsonlite::format_double(0.1) == "0.1", "format_double trims zeros");
  expect(tierpool::jsonlite::format_double(2.0) == "2.0", "format_double keeps one digit");
  expect(tierpool::jsonlite::format_double(-0.0) == "0.0", "negative zero normalized");
  expect(tierpool::jsonlite::escape("a\"b\n") == "a\\\"b\\n", "escape quotes and newlines");
}

void test_fingerprint_ignores_parameter_order() {
  std::optional<tierpool::jsonlite::JsonError> err;
  tierpool::TaskSpec a = physics("h1");
  tierpool::TaskSpec b = physics("h1");
  std::get<tierpool::PhysicsValidationRequest>(a.request).parameters =
      tierpool::jsonlite::parse("{\"efficiency_mean\":0.4,\"cost_mean\":90,\"tags\":{\"y\":1,\"x\":2}}", &err);
  std::get<tierpool::PhysicsValidationRequest>(b.request).parameters =
      tierpool::jsonlite::parse("{\"tags\":{\"x\":2,\"y\":1},\"cost_mean\":90,\"efficiency_mean\":0.4}", &err);
  expect(!err, "parameter json parses");

  const auto fa = tierpool::compute_fingerprint(a);
  expect(fa.size() == 64, "fingerprint is 64 hex chars");
  expect(fa == tierpool::compute_fingerprint(b), "field order must not change fingerprint");

  tierpool::TaskSpec urgent = a;
  urgent.priority = tierpool::Priority::critical;
  expect(fa == tierpool::compute_fingerprint(urgent), "priority is not part of the key");

  tierpool::TaskSpec other_tier = a;
  other_tier.tier = tierpool::Tier::a100;
  expect(fa != tierpool::compute_fingerprint(other_tier), "tier is part of the key");

  tierpool::TaskSpec other_kind = a;
  other_kind.request = tierpool::BatchValidationRequest{
      std::get<tierpool::PhysicsValidationRequest>(a.request).parameters};
  expect(fa != tierpool::compute_fingerprint(other_kind), "kind is part of the key");

  tierpool::TaskSpec full = a;
  std::get<tierpool::PhysicsValidationRequest>(full.request).fidelity = "full";
  expect(fa != tierpool::compute_fingerprint(full), "kind fields are part of the key");

  const auto canonical = tierpool::canonicalize_task(a);
  expect(canonical.find("\"priority\"") == std::string::npos, "canonical form omits priority");
  expect(!tierpool::jsonlite::validate_strict(canonical).has_value(), "canonical form is strict json");
}

void test_task_spec_from_json() {
  std::optional<tierpool::jsonlite::JsonError> err;
  std::string error;
  auto obj = tierpool::jsonlite::parse(
      "{\"hypothesis_id\":\"h9\",\"tier\":\"a10g\",\"priority\":\"high\",\"kind\":\"parametric_sweep\","
      "\"parameters\":{\"cost_mean\":80},\"sweep_key\":\"efficiency_mean\",\"sweep_values\":[0.2,0.3]}",
      &err);
  auto spec = tierpool::task_spec_from_json(obj, &error);
  expect(spec.has_value(), "valid task spec parses: " + error);
  expect(spec->tier == tierpool::Tier::a10g, "tier parsed");
  expect(spec->priority == tierpool::Priority::high, "priority parsed");
  const auto* sweep = std::get_if<tierpool::ParametricSweepRequest>(&spec->request);
  expect(sweep && sweep->sweep_values.size() == 2, "sweep fields parsed");

  auto bad = tierpool::jsonlite::parse("{\"hypothesis_id\":\"h\",\"tier\":\"h100\"}", &err);
  expect(!tierpool::task_spec_from_json(bad, &error).has_value(), "unknown tier rejected");
  expect(error.find("h100") != std::string::npos, "error names the bad tier");

  auto missing = tierpool::jsonlite::parse("{\"tier\":\"t4\"}", &err);
  expect(!tierpool::task_spec_from_json(missing, &error).has_value(), "missing id rejected");
}

// ============================================================================
// Queues and cache
// ============================================================================

void test_queue_priority_and_fifo() {
  using tierpool::Priority;
  tierpool::TierQueue q;
  expect(q.enqueue(queued_task("low1", Priority::low)) == 1, "first enqueue at position 1");
  expect(q.enqueue(queued_task("high", Priority::high)) == 1, "high jumps ahead of low");
  expect(q.enqueue(queued_task("normal", Priority::normal)) == 2, "normal lands between");
  expect(q.enqueue(queued_task("critical", Priority::critical)) == 1, "critical goes first");
  expect(q.enqueue(queued_task("low2", Priority::low)) == 5, "equal priority appends");

  const std::vector<std::string> expected{"critical", "high", "normal", "low1", "low2"};
  for (const auto& id : expected) {
    auto t = q.dequeue_front();
    expect(t && t->id == id, "dequeue order: expected " + id);
  }
  expect(!q.dequeue_front().has_value(), "empty queue yields nothing");
}

void test_queue_remove_and_expiry() {
  using tierpool::Priority;
  tierpool::PriorityQueueSet set;
  auto old_task = queued_task("old", Priority::normal);
  old_task.created_at -= 10s;
  set.enqueue(old_task);
  set.enqueue(queued_task("a", Priority::normal));
  auto b = queued_task("b", Priority::normal);
  b.tier = tierpool::Tier::a100;
  set.enqueue(b);
  expect(set.total_size() == 3, "three tasks queued");

  expect(set.remove("b").has_value(), "remove finds task in another tier");
  expect(!set.remove("b").has_value(), "second remove fails");
  expect(!set.remove("nope").has_value(), "unknown id not removed");

  auto expired = set.queue(tierpool::Tier::t4).remove_created_before(tierpool::Clock::now() - 1s);
  expect(expired.size() == 1 && expired[0].id == "old", "only the stale task expires");
  expect(set.size(tierpool::Tier::t4) == 1, "fresh task stays queued");
}

tierpool::ValidationResult result_named(const std::string& id) {
  tierpool::ValidationResult r;
  r.task_id = id;
  r.hypothesis_id = id;
  r.physics_valid = true;
  return r;
}

void test_cache_ttl() {
  tierpool::ResultCache cache(10, 100ms);
  const auto t0 = tierpool::Clock::now();
  cache.put("k", result_named("a"), t0);
  expect(cache.get("k", t0 + 50ms).has_value(), "entry visible within ttl");
  expect(!cache.get("k", t0 + 150ms).has_value(), "entry absent after ttl");
  expect(cache.size() == 0, "expired entry removed on access");
  expect(cache.stats().expirations == 1, "expiration counted");
}

void test_cache_insertion_order_eviction() {
  tierpool::ResultCache cache(2, 10s, tierpool::EvictionPolicy::insertion_order);
  const auto t0 = tierpool::Clock::now();
  cache.put("a", result_named("a"), t0);
  cache.put("b", result_named("b"), t0);
  expect(cache.get("a", t0).has_value(), "a readable");
  cache.put("c", result_named("c"), t0);
  expect(cache.size() == 2, "bound respected");
  expect(!cache.contains("a", t0), "oldest insert evicted even after read");
  expect(cache.contains("b", t0) && cache.contains("c", t0), "newer entries survive");

  cache.put("b", result_named("b2"), t0);
  expect(cache.size() == 2, "overwrite does not evict");
  cache.put("d", result_named("d"), t0);
  expect(!cache.contains("b", t0), "overwrite keeps original insertion position");
  expect(cache.stats().evictions == 2, "evictions counted");
}

void test_cache_lru_eviction() {
  tierpool::ResultCache cache(2, 10s, tierpool::EvictionPolicy::least_recently_used);
  const auto t0 = tierpool::Clock::now();
  cache.put("a", result_named("a"), t0);
  cache.put("b", result_named("b"), t0);
  expect(cache.get("a", t0).has_value(), "a readable");
  cache.put("c", result_named("c"), t0);
  expect(cache.contains("a", t0), "recently read entry survives");
  expect(!cache.contains("b", t0), "least recently used entry evicted");
  expect(tierpool::parse_eviction_policy("lru") == tierpool::EvictionPolicy::least_recently_used,
         "lru alias parses");
}

// ============================================================================
// Config, helpers, metrics, events
// ============================================================================

void test_config_json_and_validation() {
  std::vector<std::string> errors;
  auto cfg = tierpool::parse_config_json(
      "{\"max_concurrency\":{\"t4\":3,\"a100\":1},\"queue_timeout_ms\":1000,"
      "\"cache_eviction\":\"least_recently_used\",\"enable_cache\":false}",
      tierpool::PoolConfig{}, &errors);
  expect(cfg.has_value(), "config parses");
  expect(cfg->max_concurrency_for(tierpool::Tier::t4) == 3, "t4 concurrency overridden");
  expect(cfg->max_concurrency_for(tierpool::Tier::a10g) == 5, "a10g keeps default");
  expect(cfg->max_concurrency_for(tierpool::Tier::a100) == 1, "a100 overridden");
  expect(cfg->queue_timeout_ms == 1000, "queue timeout overridden");
  expect(!cfg->enable_cache, "cache disabled");
  expect(cfg->cache_eviction == tierpool::EvictionPolicy::least_recently_used, "eviction policy set");
  auto reg = tierpool::TierRegistry::from_config(*cfg, [](tierpool::Tier) {
    return std::shared_ptr<tierpool::IExecutionBackend>();
  });
  expect(reg.total_concurrency() == 9, "registry slots sum per-tier concurrency");

  expect(!tierpool::parse_config_json("{\"tick_interval_ms\":0}", tierpool::PoolConfig{}, &errors),
         "zero tick rejected");
  expect(!errors.empty(), "rejection carries errors");

  auto r = tierpool::validate_config("{\"queue_timeout_ms\":10,\"mystery\":1}");
  expect(r.ok, "unknown key is not fatal");
  expect(r.warnings.size() == 1, "unknown key warns");

  r = tierpool::validate_config("{\"max_concurrency\":{\"t4\":0}}");
  expect(!r.ok, "zero concurrency is an error");
  r = tierpool::validate_config("{\"a\":1,\"a\":1}");
  expect(!r.ok, "duplicate keys are an error");
  r = tierpool::validate_config("{\"enable_cache\":\"yes\"}");
  expect(!r.ok, "type mismatch is an error");

  const auto json = tierpool::config_to_json(tierpool::PoolConfig{});
  expect(!tierpool::jsonlite::validate_strict(json).has_value(), "config_to_json is strict json");
  expect(json.find("\"cache_eviction\":\"insertion_order\"") != std::string::npos,
         "default eviction is insertion order");
}

void test_config_env_overrides() {
  ::setenv("TIERPOOL_QUEUE_TIMEOUT_MS", "1234", 1);
  ::setenv("TIERPOOL_CACHE", "0", 1);
  ::setenv("TIERPOOL_TICK_MS", "not-a-number", 1);
  std::vector<std::string> errors;
  auto cfg = tierpool::load_config("", &errors);
  ::unsetenv("TIERPOOL_QUEUE_TIMEOUT_MS");
  ::unsetenv("TIERPOOL_CACHE");
  ::unsetenv("TIERPOOL_TICK_MS");

  expect(cfg.has_value(), "env-only config loads");
  expect(cfg->queue_timeout_ms == 1234, "env overrides queue timeout");
  expect(!cfg->enable_cache, "env disables cache");
  expect(cfg->tick_interval_ms == 50, "malformed env value ignored");

  ::setenv("TIERPOOL_QUEUE_TIMEOUT_MS", "10000000000000", 1);
  auto huge = tierpool::load_config("", &errors);
  ::unsetenv("TIERPOOL_QUEUE_TIMEOUT_MS");
  expect(!huge.has_value(), "oversized env timeout rejected");

  expect(!tierpool::load_config("/nonexistent/tierpool.json", &errors).has_value(),
         "missing config file is an error");
}

void test_escalation_helpers() {
  using tierpool::Tier;
  expect(tierpool::select_tier_by_score(9.0) == Tier::a100, "9.0 -> a100");
  expect(tierpool::select_tier_by_score(8.5) == Tier::a100, "8.5 -> a100");
  expect(tierpool::select_tier_by_score(7.0) == Tier::a10g, "7.0 -> a10g");
  expect(tierpool::select_tier_by_score(6.9) == Tier::t4, "6.9 -> t4");
  expect(tierpool::select_priority_by_score(9.5) == tierpool::Priority::critical, "9.5 critical");
  expect(tierpool::select_priority_by_score(8.0) == tierpool::Priority::high, "8.0 high");
  expect(tierpool::select_priority_by_score(7.2) == tierpool::Priority::normal, "7.2 normal");
  expect(tierpool::select_priority_by_score(3.0) == tierpool::Priority::low, "3.0 low");
  expect(tierpool::escalate_tier(Tier::t4) == Tier::a10g, "t4 escalates to a10g");
  expect(!tierpool::escalate_tier(Tier::a100).has_value(), "a100 is the top tier");

  tierpool::ValidationResult r;
  r.physics_valid = true;
  r.confidence_score = 0.97;
  r.economically_viable = true;
  r.metrics["lcoe"] = tierpool::MetricInterval{0.03, 0.02, 0.04};
  expect(std::abs(tierpool::score_adjustment(r) - 0.5) < 1e-9, "strong result clamps to +0.5");

  tierpool::ValidationResult weak;
  weak.confidence_score = 0.2;
  expect(std::abs(tierpool::score_adjustment(weak) + 0.5) < 1e-9, "weak result clamps to -0.5");

  tierpool::ValidationResult mixed;
  mixed.physics_valid = true;
  mixed.confidence_score = 0.8;
  expect(std::abs(tierpool::score_adjustment(mixed) - 0.2) < 1e-9, "valid but not viable");
}

void test_metrics_online_average_and_ring() {
  tierpool::PoolMetrics m(3);
  m.record_completed(100.0, 0.01);
  m.record_completed(200.0, 0.02);
  m.record_completed(600.0, 0.05);
  m.record_failed();
  m.record_queue_timeout();
  for (int i = 0; i < 5; ++i) {
    tierpool::UtilizationSnapshot s;
    s.timestamp_ms = static_cast<std::uint64_t>(i);
    m.record_utilization(s);
  }
  const auto snap = m.snapshot();
  expect(snap.completed == 3, "completed counted");
  expect(std::abs(snap.average_duration_ms - 300.0) < 1e-9, "online average");
  expect(std::abs(snap.total_cost - 0.08) < 1e-9, "cost accumulated");
  expect(snap.failed == 1 && snap.queue_timeouts == 1, "timeouts counted apart from failures");
  expect(snap.utilization_history.size() == 3, "ring buffer bounded");
  expect(snap.utilization_history.front().timestamp_ms == 2, "oldest snapshots dropped");

  const auto json = tierpool::metrics_to_json(snap);
  expect(!tierpool::jsonlite::validate_strict(json).has_value(), "metrics json is strict");
  expect(json.find("\"queue_timeouts\":1") != std::string::npos, "queue_timeouts rendered");
  expect(json.find("\"p95_ms\"") != std::string::npos, "latency percentiles rendered");
}

void test_latency_histogram() {
  tierpool::LatencyHistogram h;
  expect(h.percentile(0.5) == 0.0, "empty histogram");
  for (int i = 0; i < 99; ++i) h.record_ms(10);
  h.record_ms(5000);
  expect(h.count() == 100, "count");
  expect(h.percentile(0.5) < 20.0, "p50 in the 10ms bucket");
  expect(h.percentile(1.0) > 1000.0, "tail in the 5s bucket");
}

void test_event_bus_subscribe_and_isolation() {
  tierpool::EventBus bus;
  std::vector<std::string> seen;
  auto thrower = bus.subscribe([](const tierpool::PoolEvent&) {
    throw std::runtime_error("observer bug");
  });
  auto id = bus.subscribe([&](const tierpool::PoolEvent& ev) { seen.push_back(ev.task_id); });
  expect(bus.subscriber_count() == 2, "two subscribers");

  tierpool::PoolEvent ev;
  ev.type = tierpool::PoolEventType::queued;
  ev.task_id = "t1";
  bus.publish(ev);
  expect(seen.size() == 1 && seen[0] == "t1", "event delivered despite throwing handler");

  expect(bus.unsubscribe(id), "unsubscribe succeeds");
  expect(!bus.unsubscribe(id), "second unsubscribe fails");
  expect(bus.unsubscribe(thrower), "remove thrower");
  ev.task_id = "t2";
  bus.publish(ev);
  expect(seen.size() == 1, "no delivery after unsubscribe");
  expect(bus.published() == 2, "publish count");
}

void test_event_log_jsonl() {
  const fs::path path = fs::temp_directory_path() / "tierpool_events_test.jsonl";
  fs::remove(path);
  {
    tierpool::EventBus bus(path.string());
    tierpool::PoolEvent ev;
    ev.type = tierpool::PoolEventType::timeout;
    ev.task_id = "t\"1";
    ev.tier = tierpool::Tier::a10g;
    ev.error_code = tierpool::ErrorCode::queue_timeout;
    bus.publish(ev);
    ev.type = tierpool::PoolEventType::queues_cleared;
    ev.count = 4;
    ev.error_code = tierpool::ErrorCode::none;
    bus.publish(ev);
  }
  std::ifstream in(path);
  std::string line;
  int lines = 0;
  while (std::getline(in, line)) {
    ++lines;
    expect(!tierpool::jsonlite::validate_strict(line).has_value(), "event line is strict json");
  }
  expect(lines == 2, "one line per event");
  fs::remove(path);
}

// ============================================================================
// Pool behavior
// ============================================================================

void test_admission_follows_priority() {
  auto backend = std::make_shared<FakeBackend>();
  backend->latency = 30ms;
  auto cfg = fast_config();
  cfg.max_concurrency = {2, 5, 2};
  cfg.queue_timeout_ms = 1000;

  tierpool::ValidationPool pool(cfg, registry_for(cfg, backend));
  std::mutex mu;
  std::vector<std::string> started;
  int queued = 0;
  pool.events().subscribe([&](const tierpool::PoolEvent& ev) {
    std::lock_guard<std::mutex> lk(mu);
    if (ev.type == tierpool::PoolEventType::started) started.push_back(ev.hypothesis_id);
    if (ev.type == tierpool::PoolEventType::queued) ++queued;
  });

  using tierpool::Priority;
  std::vector<tierpool::SubmitHandle> handles;
  handles.push_back(pool.submit_async(physics("low1", tierpool::Tier::t4, Priority::low)));
  handles.push_back(pool.submit_async(physics("high", tierpool::Tier::t4, Priority::high)));
  handles.push_back(pool.submit_async(physics("normal", tierpool::Tier::t4, Priority::normal)));
  handles.push_back(pool.submit_async(physics("critical", tierpool::Tier::t4, Priority::critical)));
  handles.push_back(pool.submit_async(physics("low2", tierpool::Tier::t4, Priority::low)));
  pool.start();

  for (const auto& h : handles) {
    expect(wait_ready(h), "task settles");
    expect(h.result.get().ok, "task succeeds");
  }
  std::lock_guard<std::mutex> lk(mu);
  const std::vector<std::string> expected{"critical", "high", "normal", "low1", "low2"};
  expect(started == expected, "admission order is priority then arrival");
  expect(queued == 5, "every submission published queued");
  expect(backend->max_active.load() <= 2, "two at a time");
}

void test_concurrency_bound_under_load() {
  auto cfg = fast_config();
  cfg.max_concurrency = {3, 2, 1};
  cfg.enable_cache = false;

  std::array<std::shared_ptr<FakeBackend>, tierpool::kTierCount> backends;
  tierpool::TierRegistry reg;
  for (tierpool::Tier t : tierpool::kAllTiers) {
    auto b = std::make_shared<FakeBackend>();
    b->latency = 8ms;
    backends[tierpool::tier_index(t)] = b;
    reg.register_tier(tierpool::TierSpec{t, b, cfg.max_concurrency_for(t),
                                         tierpool::default_cost_per_task(t),
                                         tierpool::default_estimated_duration_ms(t)});
  }
  tierpool::ValidationPool pool(cfg, std::move(reg));
  pool.start();

  std::vector<tierpool::SubmitHandle> handles;
  for (int i = 0; i < 36; ++i) {
    const auto tier = tierpool::kAllTiers[static_cast<std::size_t>(i % 3)];
    handles.push_back(pool.submit_async(physics("load-" + std::to_string(i), tier)));
  }

  bool bounded = true;
  for (int sample = 0; sample < 40; ++sample) {
    const auto u = pool.utilization();
    for (const auto& tu : u.tiers) {
      if (tu.active > tu.max_concurrency) bounded = false;
    }
    std::this_thread::sleep_for(3ms);
  }
  for (const auto& h : handles) expect(wait_ready(h) && h.result.get().ok, "load task succeeds");

  expect(bounded, "running set never exceeds max concurrency");
  for (tierpool::Tier t : tierpool::kAllTiers) {
    const auto& b = backends[tierpool::tier_index(t)];
    expect(b->max_active.load() <= static_cast<int>(cfg.max_concurrency_for(t)),
           "backend concurrency bounded for " + tierpool::to_string(t));
    expect(b->calls.load() == 12, "every task of the tier executed once");
  }
  const auto m = pool.metrics();
  expect(m.completed == 36 && m.submitted == 36, "metrics count every task");
  expect(!m.utilization_history.empty(), "utilization sampled while busy");
}

void test_cache_hit_is_idempotent() {
  auto backend = std::make_shared<FakeBackend>();
  auto cfg = fast_config();
  tierpool::ValidationPool pool(cfg, registry_for(cfg, backend));
  pool.start();

  const auto first = pool.submit(physics("cached"));
  const auto second = pool.submit(physics("cached", tierpool::Tier::t4, tierpool::Priority::critical));
  expect(first.ok && second.ok, "both succeed");
  expect(!first.result.from_cache, "first is fresh");
  expect(second.result.from_cache, "second served from cache");
  expect(second.result.task_id == second.task_id, "cached result carries the new task id");
  expect(first.result.physics_valid == second.result.physics_valid &&
             first.result.confidence_score == second.result.confidence_score &&
             first.result.metrics.at("lcoe").mean == second.result.metrics.at("lcoe").mean,
         "cached result identical to the fresh one");
  expect(backend->calls.load() == 1, "no second remote call");

  const auto m = pool.metrics();
  expect(m.cache_hits == 1 && m.cache_misses == 1, "hit and miss counted");
}

void test_cache_expiry_triggers_fresh_run() {
  auto backend = std::make_shared<FakeBackend>();
  auto cfg = fast_config();
  cfg.cache_ttl_ms = 40;
  tierpool::ValidationPool pool(cfg, registry_for(cfg, backend));
  pool.start();

  expect(pool.submit(physics("ttl")).ok, "first run");
  std::this_thread::sleep_for(100ms);
  const auto again = pool.submit(physics("ttl"));
  expect(again.ok && !again.result.from_cache, "expired entry is not served");
  expect(backend->calls.load() == 2, "fresh execution after expiry");
}

void test_queue_timeout_never_dispatches() {
  auto backend = std::make_shared<FakeBackend>();
  auto cfg = fast_config();
  cfg.max_concurrency = {1, 1, 1};
  cfg.queue_timeout_ms = 80;
  tierpool::ValidationPool pool(cfg, registry_for(cfg, backend));

  std::atomic<int> timeouts{0};
  pool.events().subscribe([&](const tierpool::PoolEvent& ev) {
    if (ev.type == tierpool::PoolEventType::timeout) timeouts.fetch_add(1);
  });

  backend->close_gate();
  pool.start();
  auto holder = pool.submit_async(physics("holder"));
  while (backend->calls.load() == 0) std::this_thread::sleep_for(2ms);
  auto waiter = pool.submit_async(physics("waiter"));

  expect(wait_ready(waiter, 2000ms), "waiter settles while tier is saturated");
  const auto out = waiter.result.get();
  expect(!out.ok && out.error_code == tierpool::ErrorCode::queue_timeout, "waiter timed out in queue");

  backend->open_gate();
  expect(wait_ready(holder) && holder.result.get().ok, "holder completes");
  const auto executed = backend->executed();
  expect(executed.size() == 1 && executed[0] == "holder", "timed-out task never reached the backend");
  expect(timeouts.load() == 1, "timeout event published");

  const auto m = pool.metrics();
  expect(m.queue_timeouts == 1 && m.failed == 0, "queue timeout counted separately");
}

void test_caller_timeout() {
  auto backend = std::make_shared<FakeBackend>();
  auto cfg = fast_config();
  cfg.queue_timeout_ms = 30;
  cfg.caller_timeout_margin_ms = 30;
  tierpool::ValidationPool pool(cfg, registry_for(cfg, backend));
  backend->close_gate();
  pool.start();

  const auto out = pool.submit(physics("slow"));
  expect(!out.ok && out.error_code == tierpool::ErrorCode::caller_timeout, "caller stops waiting");
  backend->open_gate();
}

void test_failure_isolation() {
  auto backend = std::make_shared<FakeBackend>();
  backend->latency = 5ms;
  backend->error_hypotheses = {"bad-reply"};
  backend->throw_hypotheses = {"bad-throw"};
  backend->nan_hypotheses = {"bad-nan"};
  auto cfg = fast_config();
  tierpool::ValidationPool pool(cfg, registry_for(cfg, backend));
  pool.start();

  std::vector<std::pair<std::string, tierpool::SubmitHandle>> handles;
  const std::vector<std::string> ids{"ok-1", "bad-reply", "ok-2", "bad-throw", "ok-3", "bad-nan"};
  for (std::size_t i = 0; i < ids.size(); ++i) {
    const auto tier = tierpool::kAllTiers[i % tierpool::kTierCount];
    handles.emplace_back(ids[i], pool.submit_async(physics(ids[i], tier)));
  }
  for (const auto& [id, h] : handles) {
    expect(wait_ready(h), id + " settles");
    const auto out = h.result.get();
    if (id.rfind("ok-", 0) == 0) {
      expect(out.ok, id + " unaffected by failures");
    } else {
      expect(!out.ok && out.error_code == tierpool::ErrorCode::execution_failure,
             id + " fails with execution_failure");
      expect(!out.error_detail.empty(), id + " carries an error description");
    }
  }
  const auto m = pool.metrics();
  expect(m.completed == 3 && m.failed == 3, "completed and failed counted");
  expect(pool.cache()->size() == 3, "failures are never cached");
  expect(pool.running(), "scheduler keeps running");
}

void test_cancellation() {
  auto backend = std::make_shared<FakeBackend>();
  auto cfg = fast_config();
  tierpool::ValidationPool pool(cfg, registry_for(cfg, backend));

  std::atomic<int> cancelled_events{0};
  pool.events().subscribe([&](const tierpool::PoolEvent& ev) {
    if (ev.type == tierpool::PoolEventType::cancelled) cancelled_events.fetch_add(1);
  });

  auto doomed = pool.submit_async(physics("doomed"));
  auto kept = pool.submit_async(physics("kept"));
  expect(pool.cancel(doomed.task_id), "queued task cancels");
  expect(!pool.cancel(doomed.task_id), "second cancel fails");
  expect(!pool.cancel("vtask-0-unknown"), "unknown id fails");

  expect(wait_ready(doomed, 100ms), "cancelled task settles immediately");
  expect(doomed.result.get().error_code == tierpool::ErrorCode::cancelled, "cancelled outcome");

  pool.start();
  expect(wait_ready(kept) && kept.result.get().ok, "other task still runs");
  expect(!pool.cancel(kept.task_id), "finished task cannot be cancelled");

  const auto executed = backend->executed();
  expect(executed.size() == 1 && executed[0] == "kept", "cancelled task never ran");
  expect(cancelled_events.load() == 1, "one cancelled event");
  expect(pool.metrics().cancelled == 1, "cancel counted");
}

void test_running_task_not_cancellable() {
  auto backend = std::make_shared<FakeBackend>();
  auto cfg = fast_config();
  tierpool::ValidationPool pool(cfg, registry_for(cfg, backend));
  backend->close_gate();
  pool.start();
  auto h = pool.submit_async(physics("busy"));
  while (backend->calls.load() == 0) std::this_thread::sleep_for(2ms);
  expect(!pool.cancel(h.task_id), "running task is not cancellable");
  backend->open_gate();
  expect(wait_ready(h) && h.result.get().ok, "running task completes");
}

void test_clear_queues_resolves_waiters() {
  auto backend = std::make_shared<FakeBackend>();
  auto cfg = fast_config();
  tierpool::ValidationPool pool(cfg, registry_for(cfg, backend));

  std::vector<tierpool::SubmitHandle> handles;
  for (int i = 0; i < 3; ++i) handles.push_back(pool.submit_async(physics("clear-" + std::to_string(i))));
  expect(pool.utilization().total_queued == 3, "three queued");
  expect(pool.clear_queues() == 3, "three cleared");
  expect(pool.utilization().total_queued == 0, "queues empty");
  for (const auto& h : handles) {
    expect(wait_ready(h, 100ms), "cleared task settles");
    expect(h.result.get().error_code == tierpool::ErrorCode::queues_cleared, "queues_cleared outcome");
  }
  expect(backend->calls.load() == 0, "cleared tasks never ran");
}

void test_warm_up_reports_availability() {
  auto backend = std::make_shared<FakeBackend>();
  auto cfg = fast_config();
  tierpool::ValidationPool pool(cfg, registry_for(cfg, backend));
  std::vector<tierpool::PoolEventType> types;
  pool.events().subscribe([&](const tierpool::PoolEvent& ev) { types.push_back(ev.type); });

  expect(pool.warm_up(tierpool::Tier::a100, 2), "available backend warms up");
  backend->available = false;
  expect(!pool.warm_up(tierpool::Tier::a100), "unavailable backend fails warm-up");

  const std::vector<tierpool::PoolEventType> expected{
      tierpool::PoolEventType::warmup_started, tierpool::PoolEventType::warmup_complete,
      tierpool::PoolEventType::warmup_started, tierpool::PoolEventType::warmup_failed};
  expect(types == expected, "warm-up events published");
}

void test_fail_fast_when_unavailable() {
  auto backend = std::make_shared<FakeBackend>();
  backend->available = false;
  auto cfg = fast_config();
  cfg.fail_fast_unavailable = true;
  tierpool::ValidationPool pool(cfg, registry_for(cfg, backend));
  pool.start();

  auto h = pool.submit_async(physics("unreachable"));
  expect(wait_ready(h, 50ms), "rejection is immediate");
  expect(h.result.get().error_code == tierpool::ErrorCode::pool_unavailable, "pool_unavailable");
  expect(backend->calls.load() == 0, "nothing executed");

  auto lenient_cfg = fast_config();
  auto lenient_backend = std::make_shared<FakeBackend>();
  lenient_backend->available = false;
  tierpool::ValidationPool lenient(lenient_cfg, registry_for(lenient_cfg, lenient_backend));
  lenient.start();
  expect(lenient.submit(physics("queued-anyway")).ok, "default mode queues and executes");
}

void test_inflight_dedupe() {
  auto backend = std::make_shared<FakeBackend>();
  auto cfg = fast_config();
  cfg.dedupe_inflight = true;
  cfg.enable_cache = false;
  tierpool::ValidationPool pool(cfg, registry_for(cfg, backend));

  auto a = pool.submit_async(physics("twin"));
  auto b = pool.submit_async(physics("twin"));
  expect(a.task_id == b.task_id, "identical in-flight submission attaches");
  expect(pool.utilization().total_queued == 1, "only one queued");
  pool.start();
  expect(wait_ready(a) && wait_ready(b), "both settle");
  expect(a.result.get().ok && b.result.get().ok, "both succeed");
  expect(backend->calls.load() == 1, "one execution");

  auto c = pool.submit_async(physics("twin"));
  expect(c.task_id != a.task_id, "settled task no longer deduplicates");
  expect(wait_ready(c) && c.result.get().ok, "later submission runs");
}

void test_dedupe_cancel_resolves_every_attached_caller() {
  auto backend = std::make_shared<FakeBackend>();
  auto cfg = fast_config();
  cfg.dedupe_inflight = true;
  cfg.enable_cache = false;
  tierpool::ValidationPool pool(cfg, registry_for(cfg, backend));

  auto first = pool.submit_async(physics("shared"));
  auto second = pool.submit_async(physics("shared"));
  expect(first.task_id == second.task_id, "attached caller shares the task id");
  expect(pool.cancel(second.task_id), "shared task cancels");
  expect(wait_ready(first, 100ms) && wait_ready(second, 100ms), "both callers settle");
  expect(first.result.get().error_code == tierpool::ErrorCode::cancelled &&
             second.result.get().error_code == tierpool::ErrorCode::cancelled,
         "every attached caller sees cancelled");
  pool.start();
  std::this_thread::sleep_for(30ms);
  expect(backend->calls.load() == 0, "cancelled shared task never ran");
}

void test_non_standard_exception_isolated() {
  auto backend = std::make_shared<FakeBackend>();
  backend->foreign_throw_hypotheses = {"odd-throw"};
  auto cfg = fast_config();
  tierpool::ValidationPool pool(cfg, registry_for(cfg, backend));
  pool.start();

  const auto odd = pool.submit(physics("odd-throw"));
  expect(!odd.ok && odd.error_code == tierpool::ErrorCode::execution_failure,
         "non-std throw becomes execution_failure");
  expect(odd.error_detail == "unknown exception", "non-std throw described");
  expect(pool.submit(physics("after-odd")).ok, "pool keeps serving");
  expect(pool.running(), "scheduler still running");
}

void test_saturated_tier_does_not_block_others() {
  auto cfg = fast_config();
  cfg.executor_threads = 1;
  cfg.max_concurrency = {1, 1, 1};
  auto slow = std::make_shared<FakeBackend>();
  auto fast = std::make_shared<FakeBackend>();
  tierpool::TierRegistry reg;
  reg.register_tier(tierpool::TierSpec{tierpool::Tier::t4, fast, 1, 0.01, 15000});
  reg.register_tier(tierpool::TierSpec{tierpool::Tier::a100, slow, 4, 0.05, 25000});
  expect(!tierpool::check_config(cfg).empty(), "too few executor threads rejected by check_config");

  tierpool::ValidationPool pool(cfg, std::move(reg));
  slow->close_gate();
  pool.start();
  std::vector<tierpool::SubmitHandle> held;
  for (int i = 0; i < 4; ++i) {
    held.push_back(pool.submit_async(physics("held-" + std::to_string(i), tierpool::Tier::a100)));
  }
  while (slow->calls.load() < 4) std::this_thread::sleep_for(2ms);

  auto quick = pool.submit_async(physics("quick", tierpool::Tier::t4));
  expect(wait_ready(quick, 500ms), "t4 task settles while a100 is held");
  expect(quick.result.get().ok, "t4 task succeeds");

  slow->open_gate();
  for (const auto& h : held) expect(wait_ready(h) && h.result.get().ok, "held a100 task completes");
}

void test_oversized_durations_are_bounded() {
  auto backend = std::make_shared<FakeBackend>();
  auto cfg = fast_config();
  cfg.max_concurrency = {1, 1, 1};
  cfg.queue_timeout_ms = 10000000000000ULL;
  cfg.caller_timeout_margin_ms = 10000000000000ULL;
  cfg.cache_ttl_ms = 10000000000000ULL;
  expect(tierpool::check_config(cfg).size() == 3, "each oversized duration reported");

  tierpool::ValidationPool pool(cfg, registry_for(cfg, backend));
  backend->close_gate();
  pool.start();
  auto holder = pool.submit_async(physics("long-holder"));
  while (backend->calls.load() == 0) std::this_thread::sleep_for(2ms);
  auto waiter = pool.submit_async(physics("long-waiter"));
  expect(!wait_ready(waiter, 60ms), "huge queue timeout does not expire queued work");

  backend->open_gate();
  expect(wait_ready(holder) && holder.result.get().ok, "holder completes");
  expect(wait_ready(waiter) && waiter.result.get().ok, "waiter runs once a slot frees");
  expect(pool.metrics().queue_timeouts == 0, "no queue timeouts");

  const auto again = pool.submit(physics("long-holder"));
  expect(again.ok && again.result.from_cache, "huge ttl keeps the entry cached");

  tierpool::ResultCache cache(4, std::chrono::milliseconds(10000000000000LL));
  const auto t0 = tierpool::Clock::now();
  cache.put("k", result_named("k"), t0);
  expect(cache.get("k", t0 + 24h).has_value(), "bounded ttl still long-lived");
}

void test_invalid_tier_rejected() {
  auto backend = std::make_shared<FakeBackend>();
  auto cfg = fast_config();
  tierpool::TierRegistry reg;
  reg.register_tier(tierpool::TierSpec{tierpool::Tier::t4, backend, 1, 0.01, 15000});
  tierpool::ValidationPool pool(cfg, std::move(reg));
  auto h = pool.submit_async(physics("nowhere", tierpool::Tier::a100));
  expect(wait_ready(h, 50ms), "resolved immediately");
  expect(h.result.get().error_code == tierpool::ErrorCode::invalid_request, "invalid_request");
  expect(!pool.has_capacity(tierpool::Tier::a100), "unregistered tier has no capacity");
  expect(pool.has_capacity(tierpool::Tier::t4), "idle tier has capacity");
}

void test_destroy_resolves_queued_tasks() {
  auto backend = std::make_shared<FakeBackend>();
  tierpool::SubmitHandle h;
  {
    auto cfg = fast_config();
    tierpool::ValidationPool pool(cfg, registry_for(cfg, backend));
    h = pool.submit_async(physics("orphan"));
  }
  expect(wait_ready(h, 50ms), "queued task settles on destruction");
  expect(h.result.get().error_code == tierpool::ErrorCode::pool_stopped, "pool_stopped outcome");
}

// ============================================================================
// Batch coordinator
// ============================================================================

tierpool::SimulationOptions small_sim() {
  tierpool::SimulationOptions o;
  o.quick_iterations = 400;
  o.full_iterations = 800;
  o.sweep_point_iterations = 200;
  return o;
}

void test_batch_equivalence() {
  auto cfg = fast_config();
  auto bulk_backend = std::make_shared<tierpool::SimulatedBackend>(tierpool::Tier::t4, small_sim());
  auto single_backend = std::make_shared<tierpool::SimulatedBackend>(tierpool::Tier::t4, small_sim());
  tierpool::ValidationPool bulk_pool(cfg, registry_for(cfg, bulk_backend));
  tierpool::ValidationPool single_pool(cfg, registry_for(cfg, single_backend));
  bulk_pool.start();
  single_pool.start();

  std::vector<tierpool::TaskSpec> specs;
  for (int i = 0; i < 4; ++i) {
    specs.push_back(physics("eq-" + std::to_string(i), tierpool::Tier::t4, tierpool::Priority::normal,
                            0.2 + 0.1 * i));
  }
  const auto batched = bulk_pool.submit_batch(specs);
  expect(batched.size() == specs.size(), "one outcome per submission");
  expect(bulk_backend->batch_calls() == 1, "one bulk call");
  expect(bulk_backend->single_calls() == 0, "no single calls on the bulk path");

  for (std::size_t i = 0; i < specs.size(); ++i) {
    const auto single = single_pool.submit(specs[i]);
    expect(batched[i].ok && single.ok, "both paths succeed");
    expect(batched[i].result.hypothesis_id == specs[i].hypothesis_id, "input order preserved");
    expect(batched[i].result.physics_valid == single.result.physics_valid, "same validity");
    expect(batched[i].result.economically_viable == single.result.economically_viable, "same viability");
    expect(batched[i].result.confidence_score == single.result.confidence_score, "same confidence");
    expect(batched[i].result.metrics.at("lcoe").mean == single.result.metrics.at("lcoe").mean,
           "same metrics");
  }
  expect(single_backend->single_calls() == 4, "individual path makes N calls");

  const auto m = bulk_pool.metrics();
  expect(m.batch_calls == 1 && m.completed == 4 && m.submitted == 4, "bulk metrics match single path");
  expect(bulk_pool.cache()->size() == 4, "bulk results cached");

  const auto again = bulk_pool.submit_batch(specs);
  for (const auto& o : again) expect(o.ok && o.result.from_cache, "repeat batch served from cache");
  expect(bulk_backend->batch_calls() == 1, "no bulk call when everything hits");
}

void test_batch_partial_failure() {
  auto backend = std::make_shared<FakeBackend>();
  backend->nan_hypotheses = {"p-1"};
  backend->drop_last_batch_entry = true;
  auto cfg = fast_config();
  tierpool::ValidationPool pool(cfg, registry_for(cfg, backend));
  pool.start();

  std::vector<tierpool::TaskSpec> specs{physics("p-0"), physics("p-1"), physics("p-2"), physics("p-3")};
  const auto out = pool.submit_batch(specs);
  expect(backend->batch_calls.load() == 1, "single bulk call");
  expect(out[0].ok && out[2].ok, "healthy entries succeed");
  expect(!out[1].ok && out[1].error_code == tierpool::ErrorCode::batch_partial_failure,
         "malformed entry attributed to its request");
  expect(!out[3].ok && out[3].error_code == tierpool::ErrorCode::batch_partial_failure,
         "missing entry attributed to its request");
  expect(out[3].error_detail.find("missing") != std::string::npos, "missing entry described");
  expect(pool.metrics().failed == 2 && pool.metrics().completed == 2, "per-entry accounting");
}

void test_batch_whole_call_failure() {
  auto backend = std::make_shared<FakeBackend>();
  backend->throw_on_batch = true;
  auto cfg = fast_config();
  tierpool::ValidationPool pool(cfg, registry_for(cfg, backend));
  pool.start();

  const auto out = pool.submit_batch({physics("w-0"), physics("w-1")});
  for (const auto& o : out) {
    expect(!o.ok && o.error_code == tierpool::ErrorCode::execution_failure, "bulk throw fails each entry");
    expect(o.error_detail.find("unreachable") != std::string::npos, "error message preserved");
  }
}

void test_batch_fallthrough_to_queue() {
  auto backend = std::make_shared<FakeBackend>();
  auto cfg = fast_config();
  tierpool::ValidationPool pool(cfg, registry_for(cfg, backend));
  pool.start();

  tierpool::TaskSpec mc;
  mc.hypothesis_id = "mc";
  mc.request = tierpool::MonteCarloRequest{{}, 500};

  std::vector<tierpool::TaskSpec> specs{physics("t4-a"), mc, physics("t4-b"),
                                        physics("a10g-lone", tierpool::Tier::a10g)};
  const auto out = pool.submit_batch(specs);
  for (const auto& o : out) expect(o.ok, "every submission succeeds");
  expect(backend->batch_calls.load() == 1 && backend->batch_items.load() == 2,
         "only the same-tier same-kind pair is bulk executed");
  expect(backend->calls.load() == 2, "lone kind and lone tier go through the queue");

  auto no_bulk = std::make_shared<FakeBackend>();
  no_bulk->batch_supported = false;
  tierpool::ValidationPool plain(cfg, registry_for(cfg, no_bulk));
  plain.start();
  const auto plain_out = plain.submit_batch({physics("n-0"), physics("n-1"), physics("n-2")});
  for (const auto& o : plain_out) expect(o.ok, "ineligible kind still succeeds");
  expect(no_bulk->batch_calls.load() == 0 && no_bulk->calls.load() == 3, "ineligible kind uses single path");
}

// ============================================================================
// Simulated backend and serialization
// ============================================================================

void test_simulated_backend_model() {
  tierpool::SimulatedBackend sim(tierpool::Tier::a10g, small_sim());
  const auto spec = physics("sim-default");
  const auto a = sim.execute_single(spec.hypothesis_id, spec.request);
  const auto b = sim.execute_single(spec.hypothesis_id, spec.request);
  expect(a.ok && tierpool::validate_reply(a).empty(), "simulated reply is well formed");
  expect(a.physics_valid, "default efficiency is physically valid");
  expect(a.economically_viable, "default cost model is viable");
  expect(a.metrics.count("efficiency") == 1 && a.metrics.count("lcoe") == 1, "both metrics reported");
  expect(a.confidence_score == b.confidence_score, "seeded simulation is deterministic");

  const auto implausible = physics("sim-hot", tierpool::Tier::a10g, tierpool::Priority::normal, 0.95);
  expect(!sim.execute_single(implausible.hypothesis_id, implausible.request).physics_valid,
         "efficiency above the theoretical limit is invalid");

  tierpool::ParametricSweepRequest sweep;
  sweep.sweep_key = "efficiency_mean";
  sweep.sweep_values = {0.02, 0.35, 0.95};
  const auto s = sim.execute_single("sim-sweep", sweep);
  expect(s.ok && s.physics_valid, "one sweep point is valid");
  expect(std::abs(s.confidence_score - 1.0 / 3.0) < 1e-9, "confidence is the passing fraction");

  expect(sim.supports_batch(tierpool::RequestKind::physics_validation), "physics is batch eligible");
  expect(!sim.supports_batch(tierpool::RequestKind::monte_carlo), "monte carlo is not");
}

void test_reply_validation() {
  tierpool::BackendReply r;
  r.ok = true;
  r.confidence_score = 0.5;
  expect(tierpool::validate_reply(r).empty(), "plain reply valid");
  r.confidence_score = 1.5;
  expect(!tierpool::validate_reply(r).empty(), "confidence above 1 rejected");
  r.confidence_score = 0.5;
  r.metrics["x"] = tierpool::MetricInterval{1.0, 2.0, 0.5};
  expect(!tierpool::validate_reply(r).empty(), "inverted interval rejected");
}

void test_outcome_json() {
  tierpool::SubmitOutcome ok;
  ok.ok = true;
  ok.task_id = "vtask-1-1";
  ok.result.task_id = "vtask-1-1";
  ok.result.hypothesis_id = "h\"q";
  ok.result.metrics["lcoe"] = tierpool::MetricInterval{0.05, 0.04, 0.06};
  const auto s = tierpool::outcome_to_json(ok);
  expect(!tierpool::jsonlite::validate_strict(s).has_value(), "ok outcome json is strict");
  expect(s.find("\"ci95\":[0.04,0.06]") != std::string::npos, "interval rendered");

  const auto f = tierpool::outcome_to_json(
      tierpool::make_failure("vtask-1-2", tierpool::ErrorCode::queue_timeout, "waited"));
  expect(f.find("\"error_code\":\"queue_timeout\"") != std::string::npos, "error code rendered");

  const auto manifest = tierpool::version::manifest_to_json(tierpool::version::current_manifest());
  expect(!tierpool::jsonlite::validate_strict(manifest).has_value(), "manifest json is strict");
}

}  // namespace

int main() {
  std::cout << "=== tierpool tests ===\n";

  std::cout << "\n[hashing + fingerprints]\n";
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("domain separation", test_domain_separation);
  run_test("jsonlite strict + canonical", test_jsonlite_strict_and_canonical);
  run_test("fingerprint ignores parameter order", test_fingerprint_ignores_parameter_order);
  run_test("task spec from json", test_task_spec_from_json);

  std::cout << "\n[queues + cache]\n";
  run_test("queue priority + fifo", test_queue_priority_and_fifo);
  run_test("queue remove + expiry", test_queue_remove_and_expiry);
  run_test("cache ttl", test_cache_ttl);
  run_test("cache insertion-order eviction", test_cache_insertion_order_eviction);
  run_test("cache lru eviction", test_cache_lru_eviction);

  std::cout << "\n[config + helpers + observability]\n";
  run_test("config json + validation", test_config_json_and_validation);
  run_test("config env overrides", test_config_env_overrides);
  run_test("tier/priority selection", test_escalation_helpers);
  run_test("metrics online average + ring", test_metrics_online_average_and_ring);
  run_test("latency histogram", test_latency_histogram);
  run_test("event bus subscribe + isolation", test_event_bus_subscribe_and_isolation);
  run_test("event log jsonl", test_event_log_jsonl);

  std::cout << "\n[pool]\n";
  run_test("admission follows priority", test_admission_follows_priority);
  run_test("concurrency bound under load", test_concurrency_bound_under_load);
  run_test("cache hit is idempotent", test_cache_hit_is_idempotent);
  run_test("cache expiry triggers fresh run", test_cache_expiry_triggers_fresh_run);
  run_test("queue timeout never dispatches", test_queue_timeout_never_dispatches);
  run_test("caller timeout", test_caller_timeout);
  run_test("failure isolation", test_failure_isolation);
  run_test("cancellation", test_cancellation);
  run_test("running task not cancellable", test_running_task_not_cancellable);
  run_test("clear_queues resolves waiters", test_clear_queues_resolves_waiters);
  run_test("warm-up reports availability", test_warm_up_reports_availability);
  run_test("fail fast when unavailable", test_fail_fast_when_unavailable);
  run_test("in-flight dedupe", test_inflight_dedupe);
  run_test("dedupe cancel resolves every attached caller", test_dedupe_cancel_resolves_every_attached_caller);
  run_test("non-standard exception isolated", test_non_standard_exception_isolated);
  run_test("saturated tier does not block others", test_saturated_tier_does_not_block_others);
  run_test("oversized durations are bounded", test_oversized_durations_are_bounded);
  run_test("invalid tier rejected", test_invalid_tier_rejected);
  run_test("destroy resolves queued tasks", test_destroy_resolves_queued_tasks);

  std::cout << "\n[batch]\n";
  run_test("batch equivalence", test_batch_equivalence);
  run_test("batch partial failure", test_batch_partial_failure);
  run_test("batch whole-call failure", test_batch_whole_call_failure);
  run_test("batch fallthrough to queue", test_batch_fallthrough_to_queue);

  std::cout << "\n[simulation + serialization]\n";
  run_test("simulated backend model", test_simulated_backend_model);
  run_test("reply validation", test_reply_validation);
  run_test("outcome json", test_outcome_json);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
