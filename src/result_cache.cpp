#include "tierpool/result_cache.hpp"

#include <iterator>

namespace tierpool {

std::string to_string(EvictionPolicy p) {
  switch (p) {
    case EvictionPolicy::insertion_order:     return "insertion_order";
    case EvictionPolicy::least_recently_used: return "least_recently_used";
  }
  return "insertion_order";
}

std::optional<EvictionPolicy> parse_eviction_policy(const std::string& s) {
  if (s == "insertion_order" || s == "fifo") return EvictionPolicy::insertion_order;
  if (s == "least_recently_used" || s == "lru") return EvictionPolicy::least_recently_used;
  return std::nullopt;
}

ResultCache::ResultCache(std::size_t max_entries, std::chrono::milliseconds ttl,
                         EvictionPolicy policy)
    : max_entries_(max_entries),
      ttl_(ttl < bounded_ms(kMaxDurationMs) ? ttl : bounded_ms(kMaxDurationMs)),
      policy_(policy) {}

void ResultCache::erase_locked(std::unordered_map<std::string, Entry>::iterator it) {
  order_.erase(it->second.order_it);
  entries_.erase(it);
}

std::optional<ValidationResult> ResultCache::get(const std::string& fingerprint) {
  return get(fingerprint, Clock::now());
}

std::optional<ValidationResult> ResultCache::get(const std::string& fingerprint, TimePoint now) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = entries_.find(fingerprint);
  if (it == entries_.end()) {
    ++misses_;
    return std::nullopt;
  }
  if (expired(it->second, now)) {
    erase_locked(it);
    ++expirations_;
    ++misses_;
    return std::nullopt;
  }
  if (policy_ == EvictionPolicy::least_recently_used) {
    order_.splice(order_.end(), order_, it->second.order_it);
  }
  ++hits_;
  return it->second.result;
}

void ResultCache::put(const std::string& fingerprint, const ValidationResult& result) {
  put(fingerprint, result, Clock::now());
}

void ResultCache::put(const std::string& fingerprint, const ValidationResult& result,
                      TimePoint now) {
  if (max_entries_ == 0) return;
  std::lock_guard<std::mutex> lk(mu_);

  auto it = entries_.find(fingerprint);
  if (it != entries_.end()) {
    it->second.result = result;
    it->second.inserted_at = now;
    if (policy_ == EvictionPolicy::least_recently_used) {
      order_.splice(order_.end(), order_, it->second.order_it);
    }
    return;
  }

  while (entries_.size() >= max_entries_ && !order_.empty()) {
    auto victim = entries_.find(order_.front());
    if (victim == entries_.end()) {
      order_.pop_front();
      continue;
    }
    erase_locked(victim);
    ++evictions_;
  }

  order_.push_back(fingerprint);
  entries_.emplace(fingerprint, Entry{result, now, std::prev(order_.end())});
}

bool ResultCache::contains(const std::string& fingerprint, TimePoint now) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = entries_.find(fingerprint);
  return it != entries_.end() && !expired(it->second, now);
}

std::size_t ResultCache::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return entries_.size();
}

void ResultCache::clear() {
  std::lock_guard<std::mutex> lk(mu_);
  entries_.clear();
  order_.clear();
}

CacheStats ResultCache::stats() const {
  std::lock_guard<std::mutex> lk(mu_);
  CacheStats s;
  s.entries = entries_.size();
  s.hits = hits_;
  s.misses = misses_;
  s.evictions = evictions_;
  s.expirations = expirations_;
  return s;
}

}  // namespace tierpool
