/**
 * @file hash_utils.hpp
 * @brief Digests and identifiers for execution records
 *
 * Thin wrappers over OpenSSL: SHA-256 fingerprints of submitted code and
 * random v4 UUIDs for audit records.
 *
 * @date 2025
 */

#pragma once

#include <cstddef>
#include <string>

namespace capsule {
namespace utils {

/**
 * @class HashUtils
 * @brief Static hashing helpers
 *
 * **Usage**:
 * @code
 * std::string digest = HashUtils::ComputeSHA256("return 2 + 2");
 * std::string id = HashUtils::GenerateUuid();
 * @endcode
 */
class HashUtils {
public:
    /**
     * @brief SHA-256 of a byte string
     * @return Lowercase hex digest (64 characters)
     */
    static std::string ComputeSHA256(const std::string& data);

    /**
     * @brief Random RFC 4122 version 4 UUID
     *
     * Drawn from the OpenSSL CSPRNG.
     * @throws std::runtime_error if the RNG cannot be seeded
     */
    static std::string GenerateUuid();

    /// Lowercase hex encoding of raw bytes
    static std::string ToHex(const unsigned char* data, std::size_t length);
};

} // namespace utils
} // namespace capsule
