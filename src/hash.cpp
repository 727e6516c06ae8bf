#include "tierpool/hash.hpp"

// Hash authority for the pool.
//
// INVARIANTS:
//   1. BLAKE3 is the sole primitive. No fallback hash exists; a build without
//      libblake3 does not link.
//   2. Domain prefix is fed to the hasher before the payload, so "vfp:" + X
//      and "sim:" + X never collide for the same X.
//
// MICRO_DOCUMENTED: to_hex() uses a 16-entry lookup table instead of
// snprintf("%02x"); fingerprints are computed on every submission.

#include <array>

extern "C" {
#include <blake3.h>
}

namespace tierpool {
namespace {

constexpr char kHexChars[] = "0123456789abcdef";

std::string to_hex(const unsigned char* data, std::size_t len) {
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2]     = kHexChars[data[i] >> 4];
    out[i * 2 + 1] = kHexChars[data[i] & 0x0f];
  }
  return out;
}

inline int hex_nibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

std::array<unsigned char, BLAKE3_OUT_LEN> digest(std::string_view domain, std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  if (!domain.empty()) blake3_hasher_update(&hasher, domain.data(), domain.size());
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return out;
}

}  // namespace

HashRuntimeInfo hash_runtime_info() {
  HashRuntimeInfo info;
  info.primitive = "blake3";
  info.version = blake3_version();
  return info;
}

std::string blake3_hex(std::string_view payload) {
  const auto out = digest({}, payload);
  return to_hex(out.data(), out.size());
}

std::string hash_bytes_blake3(std::string_view payload) {
  const auto out = digest({}, payload);
  return std::string(reinterpret_cast<const char*>(out.data()), out.size());
}

std::string hash_domain(std::string_view domain, std::string_view payload) {
  const auto out = digest(domain, payload);
  return to_hex(out.data(), out.size());
}

std::uint64_t seed_from_hex(std::string_view hex_digest) {
  if (hex_digest.size() < 16) return 0;
  std::uint64_t seed = 0;
  for (std::size_t i = 0; i < 16; ++i) {
    const int n = hex_nibble(hex_digest[i]);
    if (n < 0) return 0;
    seed = (seed << 4) | static_cast<std::uint64_t>(n);
  }
  return seed;
}

}  // namespace tierpool
