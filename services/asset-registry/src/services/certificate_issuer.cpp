#include "certificate_issuer.h"
#include "../crypto/key_generator.h"
#include "exceptions.h"
#include "Base64Util.hpp"
#include "registry/utils/time_utils.h"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <vector>

namespace services {

namespace {

constexpr size_t ENTROPY_BYTES = 64;
constexpr size_t SALT_BYTES = 16;

} // anonymous namespace

CertificateIssuer::CertificateIssuer()
    : CertificateIssuer(crypto::secureRandomBytes,
                        [] { return std::chrono::system_clock::now(); })
{
}

CertificateIssuer::CertificateIssuer(RandomSource randomSource, Clock clock)
    : randomSource_(std::move(randomSource)), clock_(std::move(clock))
{
    if (!randomSource_ || !clock_) {
        throw std::invalid_argument("CertificateIssuer: random source and clock are required");
    }
}

domain::models::Certificate CertificateIssuer::issue(const std::string& assetId) {
    const uint64_t counterValue = counter_.fetch_add(1);

    try {
        domain::models::Certificate cert;
        cert.payload = buildPayload(assetId, counterValue);
        cert.id = crypto::generateUniqueKey(crypto::DOMAIN_KEY_SIZE);
        cert.assetId = assetId;
        cert.createdAt = registry::utils::formatIso8601(clock_(), true);

        spdlog::debug("[CertificateIssuer] Issued certificate {} for asset {} (counter={})",
                      cert.id, assetId, counterValue);
        return cert;
    } catch (const common::IssuanceException&) {
        throw;
    } catch (const std::exception& e) {
        spdlog::error("[CertificateIssuer] Issuance for asset {} failed: {}", assetId, e.what());
        throw common::IssuanceException(e.what());
    }
}

std::string CertificateIssuer::buildPayload(const std::string& assetId, uint64_t counterValue) {
    const uint64_t nanos = registry::utils::unixNanos(clock_());

    std::vector<uint8_t> entropy(ENTROPY_BYTES);
    randomSource_(entropy.data(), entropy.size());

    std::vector<uint8_t> salt(SALT_BYTES);
    randomSource_(salt.data(), salt.size());

    std::string material;
    material.reserve(256 + assetId.size());
    material += std::to_string(nanos);
    material += '*';
    material += shared::util::Base64Util::toHex(entropy);
    material += "**";
    material += std::to_string(counterValue);
    material += '*';
    material += assetId;
    material += '_';
    material += shared::util::Base64Util::encodeUrlSafeNoPad(salt);

    return shared::util::Base64Util::encodeUrlSafeNoPad(crypto::sha512(material));
}

} // namespace services
