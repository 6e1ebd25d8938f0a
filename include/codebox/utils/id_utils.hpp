/**
 * @file id_utils.hpp
 * @brief Random identifier generation
 *
 * Execution ids and generated sandbox ids are version-4 UUIDs built from
 * OpenSSL's CSPRNG, so two ids never collide in practice and cannot be
 * predicted by callers sharing the host.
 *
 * @date 2025
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace codebox {
namespace utils {

/**
 * @brief Fill a buffer with cryptographically secure random bytes
 * @param count Number of bytes
 * @return Random bytes
 * @throws std::runtime_error if the OpenSSL RNG fails
 */
std::vector<uint8_t> RandomBytes(std::size_t count);

/**
 * @brief Lowercase hexadecimal encoding of a byte buffer
 */
std::string ToHex(const std::vector<uint8_t>& bytes);

/**
 * @brief Generate an RFC 4122 version-4 UUID ("xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx")
 */
std::string GenerateUUID();

/**
 * @brief Check that a string has the canonical UUID layout
 */
bool IsUUID(const std::string& str);

} // namespace utils
} // namespace codebox
