#pragma once

/**
 * @file contract.h
 * @brief Contract domain model: at most one per asset, required for transfers
 */

#include <string>

namespace domain {
namespace models {

struct Contract {
    std::string id;
    std::string assetId;
    std::string summary;
    std::string content;
    std::string organization;

    // Audit
    std::string updatedBy;
    int updateCount = 0;
    std::string createdAt;
    std::string updatedAt;
};

struct NewContractInput {
    std::string assetId;
    std::string summary;
    std::string content;
    std::string organization;
    std::string userFingerprint;
};

} // namespace models
} // namespace domain
