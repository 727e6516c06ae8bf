#pragma once

// tierpool/version.hpp: Version manifest for every format the pool emits.
//
// INVARIANT:
//   All constants are compile-time. A change to the fingerprint canonical form,
//   the event log line schema or the config document shape bumps the matching
//   constant. Cached entries and event logs from another version are not
//   comparable.

#include <cstdint>
#include <string>

namespace tierpool {
namespace version {

constexpr const char* POOL_SEMVER = "0.3.0";

// ---------------------------------------------------------------------------
// FINGERPRINT_SCHEMA_VERSION
// Version 1 = BLAKE3("vfp:" || sorted-key JSON of hypothesis_id, kind, tier,
// kind fields, parameters). Changing any field or the double formatter bumps it.
// ---------------------------------------------------------------------------
constexpr std::uint32_t FINGERPRINT_SCHEMA_VERSION = 1;

// ---------------------------------------------------------------------------
// EVENT_LOG_FORMAT_VERSION
// Version 1 = one JSON object per line: {"event", "timestamp_ms", ...}.
// ---------------------------------------------------------------------------
constexpr std::uint32_t EVENT_LOG_FORMAT_VERSION = 1;

// ---------------------------------------------------------------------------
// CONFIG_SCHEMA_VERSION
// Version 1 = keys documented in config.hpp.
// ---------------------------------------------------------------------------
constexpr std::uint32_t CONFIG_SCHEMA_VERSION = 1;

struct VersionManifest {
  std::uint32_t fingerprint_schema{FINGERPRINT_SCHEMA_VERSION};
  std::uint32_t event_log_format{EVENT_LOG_FORMAT_VERSION};
  std::uint32_t config_schema{CONFIG_SCHEMA_VERSION};
  std::string pool_semver;
  std::string hash_primitive;
  std::string hash_version;
  std::string build_timestamp;  // from __DATE__/__TIME__
};

VersionManifest current_manifest();

std::string manifest_to_json(const VersionManifest& m);

}  // namespace version
}  // namespace tierpool
