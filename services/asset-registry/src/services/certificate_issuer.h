#pragma once

/**
 * @file certificate_issuer.h
 * @brief Issues collision-resistant certificates bound to an asset
 *
 * Payload = base64url_nopad(SHA-512(
 *     "<unix nanos>*<hex 64 random bytes>**<counter>*<asset id>_<base64url 16 random bytes>"))
 *
 * The counter is owned by the issuer instance. Create one issuer per
 * process and share it; it is safe to call issue() from many threads.
 */

#include "../domain/models/certificate.h"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace services {

class CertificateIssuer {
public:
    /// Fills the buffer with secure random bytes or throws
    using RandomSource = std::function<void(uint8_t*, size_t)>;
    /// Returns the current wall-clock time or throws
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    /**
     * @brief Issuer using the OpenSSL CSPRNG and the system clock
     */
    CertificateIssuer();

    /**
     * @brief Issuer with substituted entropy/clock sources
     * @throws std::invalid_argument if either source is empty
     */
    CertificateIssuer(RandomSource randomSource, Clock clock);

    CertificateIssuer(const CertificateIssuer&) = delete;
    CertificateIssuer& operator=(const CertificateIssuer&) = delete;

    /**
     * @brief Issue a new certificate for assetId
     *
     * The counter is incremented before any fallible step, so it advances
     * exactly once per call whether or not issuance succeeds.
     *
     * @throws common::IssuanceException on entropy or clock failure
     */
    domain::models::Certificate issue(const std::string& assetId);

    /**
     * @return Number of issue() calls so far, including failed ones
     */
    uint64_t attempts() const { return counter_.load(); }

private:
    std::atomic<uint64_t> counter_{0};
    RandomSource randomSource_;
    Clock clock_;

    std::string buildPayload(const std::string& assetId, uint64_t counterValue);
};

} // namespace services
