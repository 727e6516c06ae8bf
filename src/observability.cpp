#include "tierpool/observability.hpp"

#include <bit>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <memory>
#include <vector>

namespace tierpool {

namespace {

// MICRO_OPT: bit_width gives the bucket index in O(1) (BSR/CLZ).
inline std::size_t bucket_for_ms(std::uint64_t duration_ms) {
  if (duration_ms == 0) return 0;
  const auto b = static_cast<std::size_t>(std::bit_width(duration_ms));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

}  // namespace

std::string to_string(PoolEventType t) {
  switch (t) {
    case PoolEventType::queued:          return "queued";
    case PoolEventType::started:         return "started";
    case PoolEventType::completed:       return "completed";
    case PoolEventType::failed:          return "failed";
    case PoolEventType::timeout:         return "timeout";
    case PoolEventType::cancelled:       return "cancelled";
    case PoolEventType::cache_hit:       return "cache_hit";
    case PoolEventType::warmup_started:  return "warmup_started";
    case PoolEventType::warmup_complete: return "warmup_complete";
    case PoolEventType::warmup_failed:   return "warmup_failed";
    case PoolEventType::queues_cleared:  return "queues_cleared";
    case PoolEventType::pool_started:    return "pool_started";
    case PoolEventType::pool_stopped:    return "pool_stopped";
  }
  return "queued";
}

std::string event_to_json(const PoolEvent& ev) {
  // MICRO_OPT: one reserved buffer; events are written per lifecycle step.
  std::string line;
  line.reserve(256);
  line += "{\"event\":\"";
  line += to_string(ev.type);
  line += "\",\"timestamp_ms\":";
  line += std::to_string(ev.timestamp_ms);
  if (!ev.task_id.empty()) {
    line += ",\"task_id\":\"";
    line += jsonlite::escape(ev.task_id);
    line += "\"";
  }
  if (!ev.hypothesis_id.empty()) {
    line += ",\"hypothesis_id\":\"";
    line += jsonlite::escape(ev.hypothesis_id);
    line += "\"";
  }
  if (ev.tier) {
    line += ",\"tier\":\"";
    line += to_string(*ev.tier);
    line += "\"";
  }
  switch (ev.type) {
    case PoolEventType::queued:
      line += ",\"position\":" + std::to_string(ev.queue_position);
      break;
    case PoolEventType::started:
      line += ",\"estimated_duration_ms\":" + std::to_string(ev.estimated_duration_ms);
      break;
    case PoolEventType::queues_cleared:
      line += ",\"count\":" + std::to_string(ev.count);
      break;
    default:
      break;
  }
  if (ev.error_code != ErrorCode::none) {
    line += ",\"error_code\":\"" + to_string(ev.error_code) + "\"";
  }
  if (!ev.error.empty()) {
    line += ",\"error\":\"" + jsonlite::escape(ev.error) + "\"";
  }
  if (ev.result) {
    line += ",\"result\":" + result_to_json(*ev.result);
  }
  line += "}";
  return line;
}

// ---------------------------------------------------------------------------
// EventBus
// ---------------------------------------------------------------------------

EventBus::EventBus(std::string log_path) : log_path_(std::move(log_path)) {
  if (log_path_.empty()) {
    // Activation: TIERPOOL_EVENT_LOG=/path/to/events.jsonl
    if (const char* env = std::getenv("TIERPOOL_EVENT_LOG"); env && env[0]) log_path_ = env;
  }
}

EventBus::SubscriptionId EventBus::subscribe(Handler handler) {
  std::lock_guard<std::mutex> lk(mu_);
  const SubscriptionId id = next_id_++;
  handlers_.emplace(id, std::make_shared<Handler>(std::move(handler)));
  return id;
}

bool EventBus::unsubscribe(SubscriptionId id) {
  std::lock_guard<std::mutex> lk(mu_);
  return handlers_.erase(id) > 0;
}

std::size_t EventBus::subscriber_count() const {
  std::lock_guard<std::mutex> lk(mu_);
  return handlers_.size();
}

void EventBus::publish(PoolEvent ev) {
  if (ev.timestamp_ms == 0) ev.timestamp_ms = unix_time_ms();
  published_.fetch_add(1, std::memory_order_relaxed);

  std::vector<std::shared_ptr<Handler>> snapshot;
  {
    std::lock_guard<std::mutex> lk(mu_);
    snapshot.reserve(handlers_.size());
    for (const auto& [id, h] : handlers_) snapshot.push_back(h);
  }
  for (const auto& h : snapshot) {
    try {
      (*h)(ev);
    } catch (const std::exception& e) {
      log_line(std::string("event handler threw on ") + to_string(ev.type) + ": " + e.what());
    }
  }

  if (!log_path_.empty()) append_log(ev);
}

void EventBus::append_log(const PoolEvent& ev) {
  std::string line = event_to_json(ev);
  line += '\n';
  std::lock_guard<std::mutex> lk(log_mu_);
  // O_APPEND; each line goes out in a single fwrite.
  if (FILE* f = std::fopen(log_path_.c_str(), "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  }
}

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record_ms(std::uint64_t duration_ms) {
  buckets_[bucket_for_ms(duration_ms)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_ms_.fetch_add(duration_ms, std::memory_order_relaxed);
}

double LatencyHistogram::mean_ms() const {
  const std::uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_ms_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const std::uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;

  std::uint64_t counts[kBuckets];
  for (std::size_t i = 0; i < kBuckets; ++i) {
    counts[i] = buckets_[i].load(std::memory_order_relaxed);
  }

  const auto target = static_cast<std::uint64_t>(p * static_cast<double>(n));
  std::uint64_t cumulative = 0;
  for (std::size_t i = 0; i < kBuckets; ++i) {
    cumulative += counts[i];
    if (cumulative >= target && cumulative > 0) {
      // Midpoint of [2^(i-1), 2^i); bucket 0 -> 0.5ms.
      const double lo = (i == 0) ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double hi = static_cast<double>(1ULL << i);
      return (lo + hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

std::string LatencyHistogram::to_json() const {
  std::string out;
  out.reserve(160);
  char buf[32];
  out += "{\"count\":";
  out += std::to_string(count());
  out += ",\"mean_ms\":";
  std::snprintf(buf, sizeof(buf), "%.2f", mean_ms());
  out += buf;
  out += ",\"p50_ms\":";
  std::snprintf(buf, sizeof(buf), "%.2f", percentile(0.50));
  out += buf;
  out += ",\"p95_ms\":";
  std::snprintf(buf, sizeof(buf), "%.2f", percentile(0.95));
  out += buf;
  out += ",\"p99_ms\":";
  std::snprintf(buf, sizeof(buf), "%.2f", percentile(0.99));
  out += buf;
  out += '}';
  return out;
}

void log_line(const std::string& message) {
  std::fprintf(stderr, "[tierpool] %s\n", message.c_str());
}

}  // namespace tierpool
