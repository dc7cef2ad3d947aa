/**
 * @file key_generator.cpp
 * @brief Key generation using OpenSSL RAND_bytes + EVP digests
 */

#include "key_generator.h"
#include <openssl/rand.h>
#include <openssl/evp.h>
#include <climits>
#include <stdexcept>

namespace crypto {

namespace {

const char BASE62[] = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";
constexpr unsigned BASE62_LEN = 62;
// Largest multiple of 62 that fits in a byte; bytes at or above it are redrawn
constexpr unsigned REJECT_THRESHOLD = (256 / BASE62_LEN) * BASE62_LEN;

} // anonymous namespace

void secureRandomBytes(uint8_t* out, size_t length) {
    if (length == 0) {
        return;
    }
    if (length > static_cast<size_t>(INT_MAX)) {
        throw std::runtime_error("random buffer too large");
    }
    if (RAND_bytes(out, static_cast<int>(length)) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
}

std::string generateUniqueKey(size_t length) {
    std::string result;
    result.reserve(length);

    std::vector<uint8_t> buf(length + 8);
    while (result.size() < length) {
        secureRandomBytes(buf.data(), buf.size());
        for (uint8_t b : buf) {
            if (b >= REJECT_THRESHOLD) {
                continue;
            }
            result += BASE62[b % BASE62_LEN];
            if (result.size() == length) {
                break;
            }
        }
    }
    return result;
}

std::vector<uint8_t> sha512(const std::string& input) {
    std::vector<uint8_t> digest(EVP_MAX_MD_SIZE);
    unsigned int digestLen = 0;

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) throw std::runtime_error("EVP_MD_CTX_new failed");

    if (EVP_DigestInit_ex(ctx, EVP_sha512(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx, input.data(), input.size()) != 1 ||
        EVP_DigestFinal_ex(ctx, digest.data(), &digestLen) != 1) {
        EVP_MD_CTX_free(ctx);
        throw std::runtime_error("SHA-512 digest failed");
    }
    EVP_MD_CTX_free(ctx);

    digest.resize(digestLen);
    return digest;
}

} // namespace crypto
