#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace strata::util {

// Lower-case hex SHA-256 of the input. Used as the content hash of blobs.
std::string Sha256Hex(std::string_view data);

// FNV-1a 64-bit. Stable across platforms; used for feature hashing and
// query signatures where a cryptographic digest is unnecessary.
uint64_t Fnv1a64(std::string_view data, uint64_t seed = 14695981039346656037ULL);

std::string ToHex(uint64_t value);

} // namespace strata::util
