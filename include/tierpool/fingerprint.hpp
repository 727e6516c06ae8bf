#pragma once

// tierpool/fingerprint.hpp: Cache keys for validation tasks.
//
// fingerprint = BLAKE3("vfp:" || canonical_json(task))
//
// The canonical document contains hypothesis_id, kind, tier, the parameter set
// and the kind-specific fields, serialized through jsonlite (sorted keys, no
// whitespace). Priority is deliberately absent: the same work at a different
// priority yields the same result and must hit the same cache entry.
//
// INVARIANT: two specs fingerprint equal iff their canonical documents are
// byte-identical. Parameter insertion order never matters.

#include <string>

#include "tierpool/types.hpp"

namespace tierpool {

std::string canonicalize_task(const std::string& hypothesis_id, Tier tier,
                              const ValidationRequest& request);
std::string canonicalize_task(const TaskSpec& spec);

// Canonical request only (no hypothesis, no tier). Seeds the simulated backend.
std::string canonicalize_request(const ValidationRequest& request);

std::string compute_fingerprint(const TaskSpec& spec);
std::string compute_fingerprint(const std::string& hypothesis_id, Tier tier,
                                const ValidationRequest& request);

}  // namespace tierpool
