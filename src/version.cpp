#include "tierpool/version.hpp"

#include <sstream>

#include "tierpool/hash.hpp"

namespace tierpool {
namespace version {

VersionManifest current_manifest() {
  VersionManifest m;
  m.pool_semver = POOL_SEMVER;
  const HashRuntimeInfo info = hash_runtime_info();
  m.hash_primitive = info.primitive;
  m.hash_version = info.version;
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"fingerprint_schema\":" << m.fingerprint_schema
    << ",\"event_log_format\":" << m.event_log_format
    << ",\"config_schema\":" << m.config_schema
    << ",\"pool_semver\":\"" << m.pool_semver << "\""
    << ",\"hash_primitive\":\"" << m.hash_primitive << "\""
    << ",\"hash_version\":\"" << m.hash_version << "\""
    << ",\"build_timestamp\":\"" << m.build_timestamp << "\""
    << "}";
  return o.str();
}

}  // namespace version
}  // namespace tierpool
