#pragma once

/**
 * @file key_generator.h
 * @brief Random identifiers and digests built on OpenSSL
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace crypto {

/**
 * @brief Length of asset, certificate and contract ids
 */
constexpr size_t DOMAIN_KEY_SIZE = 24;

/**
 * @brief Fill a buffer from the OpenSSL CSPRNG
 * @throws std::runtime_error if RAND_bytes fails
 */
void secureRandomBytes(uint8_t* out, size_t length);

/**
 * @brief Random base62 string ([0-9A-Za-z]) of the given length
 *
 * Bytes are drawn from RAND_bytes with rejection sampling so every
 * character is equally likely.
 * @throws std::runtime_error if RAND_bytes fails
 */
std::string generateUniqueKey(size_t length = DOMAIN_KEY_SIZE);

/**
 * @brief SHA-512 digest (64 bytes)
 * @throws std::runtime_error on EVP failure
 */
std::vector<uint8_t> sha512(const std::string& input);

} // namespace crypto
