#pragma once

// tierpool/hash.hpp: BLAKE3 hashing primitives.
//
// BLAKE3 is the only hash primitive in the pool. It keys the result cache
// (see fingerprint.hpp) and seeds the simulated backend's random streams.
//
// Domain separation: every digest used as a key is computed through
// hash_domain() with a short prefix ("vfp:" for fingerprints, "sim:" for
// simulation seeds). Prefixes are part of the key schema; changing one
// invalidates every cached entry and must bump FINGERPRINT_SCHEMA_VERSION.

#include <cstdint>
#include <string>
#include <string_view>

namespace tierpool {

struct HashRuntimeInfo {
  std::string primitive;
  std::string version;
};

HashRuntimeInfo hash_runtime_info();

// 64-char lowercase hex digest of `payload`.
std::string blake3_hex(std::string_view payload);

// Raw 32-byte digest.
std::string hash_bytes_blake3(std::string_view payload);

std::string hash_domain(std::string_view domain, std::string_view payload);

// First 8 bytes of a hex digest, big-endian. Returns 0 for input shorter
// than 16 hex chars or containing non-hex characters.
std::uint64_t seed_from_hex(std::string_view hex_digest);

}  // namespace tierpool
