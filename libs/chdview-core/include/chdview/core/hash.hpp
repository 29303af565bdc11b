#pragma once

/**
@file
@brief Hashing types and functions.

Content hashes are XXH128 digests of an image's decoded logical data. SHA-1 digests stored in CHD headers are carried
as raw byte arrays and only ever compared and printed.
*/

#include <array>
#include <cstdint>
#include <string>

namespace chdview {

/// @brief Canonical representation of an XXH128 hash.
using XXH128Hash = std::array<uint8_t, 16>;

/// @brief Raw SHA-1 digest as stored in CHD headers.
using SHA1Digest = std::array<uint8_t, 20>;

/// @brief Calculates the XXH128 hash of the input.
/// @param[in] input the input data
/// @param[in] len the length of the input data
/// @param[in] seed the hash seed
/// @return a `XXH128Hash` with the canonical hash of the input
XXH128Hash CalcHash128(const void *input, size_t len, uint64_t seed = 0);

/// @brief Converts a `XXH128Hash` into a string.
/// @param[in] hash the hash
/// @return the hash as a 32-character string of hex digits
std::string ToString(const XXH128Hash &hash);

/// @brief Converts a `SHA1Digest` into a string.
/// @param[in] digest the digest
/// @return the digest as a 40-character string of lowercase hex digits
std::string ToString(const SHA1Digest &digest);

/// @brief Determines if the digest is all zeros, which CHD headers use to mark an absent digest.
bool IsEmpty(const SHA1Digest &digest);

} // namespace chdview
