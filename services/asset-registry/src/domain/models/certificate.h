#pragma once

/**
 * @file certificate.h
 * @brief Non-fungible certificate bound to one asset, and its ownership trail
 */

#include <string>

namespace domain {
namespace models {

/**
 * @brief Certificate issued when an asset is registered
 *
 * Never mutated: ownership changes are recorded as OwnershipTrailEntry rows.
 */
struct Certificate {
    std::string id;
    std::string assetId;
    std::string payload;   // URL-safe base64 SHA-512 digest, no padding
    std::string createdAt;
};

/**
 * @brief One append-only ownership record (initial issuance or a transfer)
 */
struct OwnershipTrailEntry {
    std::string certificateId;
    std::string assetId;
    std::string newOwnerFingerprint;
    std::string transferredOn;
};

} // namespace models
} // namespace domain
