/**
 * @file hash_utils.hpp
 * @brief Digest and identifier helpers backed by OpenSSL
 * 
 * Program fingerprints (SHA-256 of the submitted text) correlate host log
 * lines with a specific program without logging the program itself. Random
 * UUIDs identify rows created through the in-memory capability store.
 * 
 * @date 2025
 */

#pragma once

#include <string>
#include <cstddef>

namespace capsule {
namespace utils {

/**
 * @class HashUtils
 * @brief Static hashing helpers
 * 
 * **Usage Example**:
 * @code
 * std::string fingerprint = HashUtils::ComputeSHA256(program_text);
 * std::string id = HashUtils::GenerateUuid();  // "3f2b9c1e-...-4..."
 * @endcode
 */
class HashUtils {
public:
    /**
     * @brief Compute SHA-256 of a byte string
     * @param data Input bytes
     * @return Lowercase hex digest (64 characters)
     */
    static std::string ComputeSHA256(const std::string& data);

    /**
     * @brief Generate an RFC 4122 version 4 UUID
     * 
     * @return Canonical 36-character textual form
     * @throws std::runtime_error if the OpenSSL RNG fails
     */
    static std::string GenerateUuid();

    /**
     * @brief Hex-encode raw bytes
     */
    static std::string BinaryToHex(const unsigned char* data, std::size_t length);
};

} // namespace utils
} // namespace capsule
