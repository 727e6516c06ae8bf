#include "tierpool/backend.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <thread>

#include "tierpool/fingerprint.hpp"
#include "tierpool/hash.hpp"

namespace tierpool {

std::string validate_reply(const BackendReply& reply) {
  if (!std::isfinite(reply.confidence_score) || reply.confidence_score < 0.0 ||
      reply.confidence_score > 1.0) {
    return "confidence_score out of range [0,1]";
  }
  for (const auto& [name, m] : reply.metrics) {
    if (!std::isfinite(m.mean) || !std::isfinite(m.ci95_low) || !std::isfinite(m.ci95_high)) {
      return "metric '" + name + "' is not finite";
    }
    if (m.ci95_low > m.ci95_high) return "metric '" + name + "' has inverted interval";
  }
  return {};
}

namespace {

struct SampleStats {
  double mean{0.0};
  double std{0.0};
  double median{0.0};
  double p025{0.0};
  double p975{0.0};
};

// Linear interpolation between closest ranks on sorted input.
double percentile_sorted(const std::vector<double>& sorted, double p) {
  if (sorted.empty()) return 0.0;
  const double rank = p * static_cast<double>(sorted.size() - 1);
  const auto lo = static_cast<std::size_t>(std::floor(rank));
  const auto hi = static_cast<std::size_t>(std::ceil(rank));
  const double frac = rank - static_cast<double>(lo);
  return sorted[lo] + (sorted[hi] - sorted[lo]) * frac;
}

SampleStats summarize(std::vector<double>& samples) {
  SampleStats s;
  if (samples.empty()) return s;
  double sum = 0.0;
  for (double x : samples) sum += x;
  s.mean = sum / static_cast<double>(samples.size());
  double var = 0.0;
  for (double x : samples) var += (x - s.mean) * (x - s.mean);
  s.std = std::sqrt(var / static_cast<double>(samples.size()));
  std::sort(samples.begin(), samples.end());
  s.median = percentile_sorted(samples, 0.5);
  s.p025 = percentile_sorted(samples, 0.025);
  s.p975 = percentile_sorted(samples, 0.975);
  return s;
}

struct Outcome {
  bool physics_valid{false};
  bool economically_viable{false};
  double confidence{0.0};
  SampleStats efficiency;
  SampleStats lcoe;
};

Outcome run_model(const jsonlite::Object& p, std::uint64_t iterations, std::uint64_t seed) {
  const double eff_mean = jsonlite::get_double(p, "efficiency_mean", 0.35);
  const double eff_std = jsonlite::get_double(p, "efficiency_std", 0.05);
  const double cost_mean = jsonlite::get_double(p, "cost_mean", 100.0);
  const double cost_std = jsonlite::get_double(p, "cost_std", 20.0);
  const double capacity_kw = jsonlite::get_double(p, "capacity_kw", 1000.0);
  const double capacity_factor = jsonlite::get_double(p, "capacity_factor", 0.25);
  const double lifetime = jsonlite::get_double(p, "lifetime_years", 25.0);
  const double max_eff = jsonlite::get_double(p, "theoretical_max_efficiency", 0.85);
  const double target_lcoe = jsonlite::get_double(p, "target_lcoe", 0.10);

  std::mt19937_64 rng(seed);
  std::normal_distribution<double> eff_dist(eff_mean, std::max(eff_std, 0.0));
  std::normal_distribution<double> cost_dist(cost_mean, std::max(cost_std, 0.0));

  const std::size_t n = static_cast<std::size_t>(std::max<std::uint64_t>(iterations, 1));
  std::vector<double> eff(n);
  std::vector<double> lcoe(n);
  const double denom_base = capacity_kw * capacity_factor * 8760.0 * lifetime;
  for (std::size_t i = 0; i < n; ++i) {
    const double e = std::clamp(eff_dist(rng), 0.01, 0.99);
    const double c = std::max(cost_dist(rng), 1.0);
    eff[i] = e;
    lcoe[i] = denom_base > 0.0 ? (c * 1000.0) / (denom_base * e) : 0.0;
  }

  Outcome o;
  o.efficiency = summarize(eff);
  o.lcoe = summarize(lcoe);
  o.physics_valid = o.efficiency.mean >= 0.05 && o.efficiency.mean <= max_eff;
  o.economically_viable = o.lcoe.median <= target_lcoe;
  o.confidence = o.lcoe.mean > 0.0 ? std::clamp(1.0 - o.lcoe.std / o.lcoe.mean, 0.0, 1.0) : 0.0;
  return o;
}

void put_metrics(BackendReply& r, const Outcome& o) {
  r.metrics["efficiency"] = MetricInterval{o.efficiency.mean, o.efficiency.p025, o.efficiency.p975};
  r.metrics["lcoe"] = MetricInterval{o.lcoe.mean, o.lcoe.p025, o.lcoe.p975};
}

}  // namespace

SimulatedBackend::SimulatedBackend(Tier tier, SimulationOptions options)
    : tier_(tier), options_(options) {}

BackendReply SimulatedBackend::simulate(const std::string& hypothesis_id,
                                        const ValidationRequest& request) const {
  const std::uint64_t seed =
      seed_from_hex(hash_domain("sim:", hypothesis_id + "|" + canonicalize_request(request)));
  const auto cap = [this](std::uint64_t n) { return std::min(n, options_.max_iterations); };

  BackendReply r;
  r.ok = true;

  if (const auto* sweep = std::get_if<ParametricSweepRequest>(&request)) {
    // One model run per sweep point; report the point with the lowest median LCOE.
    std::size_t passing = 0;
    std::optional<Outcome> best;
    for (std::size_t i = 0; i < sweep->sweep_values.size(); ++i) {
      jsonlite::Object point = sweep->parameters;
      point[sweep->sweep_key] = jsonlite::Value{sweep->sweep_values[i]};
      const Outcome o = run_model(point, cap(options_.sweep_point_iterations), seed + i);
      if (o.physics_valid) r.physics_valid = true;
      if (o.economically_viable) r.economically_viable = true;
      if (o.physics_valid && o.economically_viable) ++passing;
      if (!best || o.lcoe.median < best->lcoe.median) best = o;
    }
    if (best) put_metrics(r, *best);
    r.confidence_score = sweep->sweep_values.empty()
        ? 0.0
        : static_cast<double>(passing) / static_cast<double>(sweep->sweep_values.size());
    return r;
  }

  std::uint64_t iterations = options_.quick_iterations;
  if (const auto* mc = std::get_if<MonteCarloRequest>(&request)) {
    iterations = mc->iterations;
  } else if (const auto* phys = std::get_if<PhysicsValidationRequest>(&request)) {
    iterations = phys->fidelity == "full" ? options_.full_iterations : options_.quick_iterations;
  }
  const Outcome o = run_model(request_parameters(request), cap(iterations), seed);
  r.physics_valid = o.physics_valid;
  r.economically_viable = o.economically_viable;
  r.confidence_score = o.confidence;
  put_metrics(r, o);
  return r;
}

BackendReply SimulatedBackend::execute_single(const std::string& hypothesis_id,
                                              const ValidationRequest& request) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    ++single_calls_;
  }
  if (options_.latency_ms > 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(options_.latency_ms));
  }
  return simulate(hypothesis_id, request);
}

bool SimulatedBackend::supports_batch(RequestKind kind) const {
  return options_.batch_enabled &&
         (kind == RequestKind::physics_validation || kind == RequestKind::batch_validation);
}

BatchReply SimulatedBackend::execute_batch(RequestKind kind, const std::vector<BatchItem>& items) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    ++batch_calls_;
  }
  BatchReply reply;
  if (!supports_batch(kind)) {
    reply.error = "bulk execution not supported for " + to_string(kind);
    return reply;
  }
  if (options_.latency_ms > 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(options_.latency_ms));
  }
  reply.ok = true;
  reply.entries.reserve(items.size());
  for (const auto& item : items) {
    reply.entries.emplace_back(simulate(item.hypothesis_id, item.request));
  }
  return reply;
}

std::uint64_t SimulatedBackend::single_calls() const {
  std::lock_guard<std::mutex> lk(mu_);
  return single_calls_;
}

std::uint64_t SimulatedBackend::batch_calls() const {
  std::lock_guard<std::mutex> lk(mu_);
  return batch_calls_;
}

}  // namespace tierpool
