#pragma once

// tierpool/result_cache.hpp: Fingerprint-keyed result cache.
//
// DESIGN INVARIANTS:
//   1. Key = task fingerprint (fingerprint.hpp). Only successful results are
//      stored; failures are never cached.
//   2. TTL is measured from insertion. An entry older than ttl is treated as
//      absent on lookup and removed at that moment (lazy expiry).
//   3. size() <= max_entries after every put(). When a NEW key would exceed
//      the bound, the entry chosen by the eviction policy is removed first.
//   4. Overwriting an existing key never evicts. Under insertion_order it keeps
//      its original position; under least_recently_used it becomes newest.
//
// Thread-safety: all methods lock an internal mutex. The executor writes and
// the pool reads from different threads.
//
// EXTENSION_POINT: shared_result_cache
//   Current: in-process map. Upgrade path: an ICASBackend-style interface with
//   a networked implementation so several pools share hits. The key scheme
//   ("vfp:" fingerprints) must not change without bumping the schema version.

#include <cstddef>
#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "tierpool/types.hpp"

namespace tierpool {

enum class EvictionPolicy { insertion_order, least_recently_used };

std::string to_string(EvictionPolicy p);
std::optional<EvictionPolicy> parse_eviction_policy(const std::string& s);

struct CacheStats {
  std::size_t entries{0};
  std::uint64_t hits{0};
  std::uint64_t misses{0};
  std::uint64_t evictions{0};
  std::uint64_t expirations{0};
};

class ResultCache {
 public:
  ResultCache(std::size_t max_entries, std::chrono::milliseconds ttl,
              EvictionPolicy policy = EvictionPolicy::insertion_order);

  std::optional<ValidationResult> get(const std::string& fingerprint);
  std::optional<ValidationResult> get(const std::string& fingerprint, TimePoint now);

  void put(const std::string& fingerprint, const ValidationResult& result);
  void put(const std::string& fingerprint, const ValidationResult& result, TimePoint now);

  // Presence check without touching recency or hit counters. Honors TTL.
  bool contains(const std::string& fingerprint, TimePoint now) const;

  std::size_t size() const;
  void clear();
  CacheStats stats() const;

  std::size_t max_entries() const { return max_entries_; }
  std::chrono::milliseconds ttl() const { return ttl_; }
  EvictionPolicy policy() const { return policy_; }

 private:
  struct Entry {
    ValidationResult result;
    TimePoint inserted_at;
    std::list<std::string>::iterator order_it;
  };

  bool expired(const Entry& e, TimePoint now) const { return now - e.inserted_at >= ttl_; }
  void erase_locked(std::unordered_map<std::string, Entry>::iterator it);

  const std::size_t max_entries_;
  const std::chrono::milliseconds ttl_;
  const EvictionPolicy policy_;

  mutable std::mutex mu_;
  std::unordered_map<std::string, Entry> entries_;
  std::list<std::string> order_;  // front = next eviction victim
  std::uint64_t hits_{0};
  std::uint64_t misses_{0};
  std::uint64_t evictions_{0};
  std::uint64_t expirations_{0};
};

}  // namespace tierpool
