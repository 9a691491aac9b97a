#pragma once
#include <string>
#include "memory/types.hpp"

namespace reverie::memory {

// SHA-256 hex digest of arbitrary bytes (OpenSSL EVP).
std::string sha256_hex(const std::string& data);

// Stable content hash of an episode payload. Keys of the canonical JSON are
// sorted, so equal payloads hash equally regardless of field insertion order.
std::string episode_content_hash(EpisodeKind kind, const EpisodePayload& payload);

} // namespace reverie::memory
