/**
 * @file hash_utils.cpp
 * @brief Implementation of digest and identifier helpers
 * 
 * @date 2025
 */

#include "capsule/utils/hash_utils.hpp"

#include <openssl/rand.h>
#include <openssl/sha.h>

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace capsule {
namespace utils {

std::string HashUtils::BinaryToHex(const unsigned char* data, std::size_t length) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

// Compute SHA256 hash (string)
std::string HashUtils::ComputeSHA256(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    return BinaryToHex(hash, SHA256_DIGEST_LENGTH);
}

// Version 4 UUID: 122 random bits, version and variant bits fixed
std::string HashUtils::GenerateUuid() {
    unsigned char bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        throw std::runtime_error("Failed to generate random identifier");
    }

    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);

    std::string hex = BinaryToHex(bytes, sizeof(bytes));
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

} // namespace utils
} // namespace capsule
