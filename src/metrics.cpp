#include "tierpool/metrics.hpp"

#include <cmath>

namespace tierpool {

std::string utilization_to_json(const UtilizationSnapshot& u) {
  std::string out;
  out.reserve(256);
  out += "{\"timestamp_ms\":";
  out += std::to_string(u.timestamp_ms);
  out += ",\"tiers\":{";
  bool first = true;
  for (const auto& t : u.tiers) {
    if (!first) out += ',';
    first = false;
    out += "\"" + to_string(t.tier) + "\":{\"active\":";
    out += std::to_string(t.active);
    out += ",\"max\":";
    out += std::to_string(t.max_concurrency);
    out += ",\"queued\":";
    out += std::to_string(t.queued);
    out += ",\"utilization\":";
    out += jsonlite::format_double(t.ratio);
    out += '}';
  }
  out += "},\"total_active\":";
  out += std::to_string(u.total_active);
  out += ",\"total_queued\":";
  out += std::to_string(u.total_queued);
  out += '}';
  return out;
}

std::string metrics_to_json(const MetricsSnapshot& m) {
  std::string out;
  out.reserve(512 + m.utilization_history.size() * 200);
  out += "{\"submitted\":" + std::to_string(m.submitted);
  out += ",\"completed\":" + std::to_string(m.completed);
  out += ",\"failed\":" + std::to_string(m.failed);
  out += ",\"queue_timeouts\":" + std::to_string(m.queue_timeouts);
  out += ",\"cancelled\":" + std::to_string(m.cancelled);
  out += ",\"cache\":{\"hits\":" + std::to_string(m.cache_hits);
  out += ",\"misses\":" + std::to_string(m.cache_misses) + "}";
  out += ",\"batch_calls\":" + std::to_string(m.batch_calls);
  out += ",\"total_cost\":" + jsonlite::format_double(m.total_cost);
  out += ",\"average_duration_ms\":" + jsonlite::format_double(m.average_duration_ms);
  out += ",\"latency\":" + (m.latency_json.empty() ? std::string("{}") : m.latency_json);
  out += ",\"utilization_history\":[";
  for (std::size_t i = 0; i < m.utilization_history.size(); ++i) {
    if (i) out += ',';
    out += utilization_to_json(m.utilization_history[i]);
  }
  out += "]}";
  return out;
}

PoolMetrics::PoolMetrics(std::size_t history_capacity) : history_capacity_(history_capacity) {}

void PoolMetrics::record_completed(double duration_ms, double cost) {
  completed_.fetch_add(1, std::memory_order_relaxed);
  const double d = std::isfinite(duration_ms) && duration_ms > 0.0 ? duration_ms : 0.0;
  latency_.record_ms(static_cast<std::uint64_t>(d));

  std::lock_guard<std::mutex> lk(mu_);
  total_cost_ += cost;
  ++duration_samples_;
  average_duration_ms_ += (d - average_duration_ms_) / static_cast<double>(duration_samples_);
}

void PoolMetrics::record_utilization(const UtilizationSnapshot& snap) {
  if (history_capacity_ == 0) return;
  std::lock_guard<std::mutex> lk(mu_);
  if (history_.size() >= history_capacity_) history_.pop_front();
  history_.push_back(snap);
}

MetricsSnapshot PoolMetrics::snapshot() const {
  MetricsSnapshot m;
  m.submitted = submitted_.load(std::memory_order_relaxed);
  m.completed = completed_.load(std::memory_order_relaxed);
  m.failed = failed_.load(std::memory_order_relaxed);
  m.queue_timeouts = queue_timeouts_.load(std::memory_order_relaxed);
  m.cancelled = cancelled_.load(std::memory_order_relaxed);
  m.cache_hits = cache_hits_.load(std::memory_order_relaxed);
  m.cache_misses = cache_misses_.load(std::memory_order_relaxed);
  m.batch_calls = batch_calls_.load(std::memory_order_relaxed);
  m.latency_json = latency_.to_json();
  std::lock_guard<std::mutex> lk(mu_);
  m.total_cost = total_cost_;
  m.average_duration_ms = average_duration_ms_;
  m.utilization_history.assign(history_.begin(), history_.end());
  return m;
}

}  // namespace tierpool
