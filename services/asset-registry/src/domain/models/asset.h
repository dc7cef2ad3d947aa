#pragma once

/**
 * @file asset.h
 * @brief Asset domain model
 */

#include <string>
#include <optional>

namespace domain {
namespace models {

/**
 * @brief A registered digital asset
 *
 * `symbol` is always stored uppercase. `organization` is the UUID-shaped
 * group currently holding the asset and `ownerFingerprint` the holder's
 * opaque identity.
 */
struct Asset {
    std::string id;
    std::string name;
    std::string symbol;
    std::string description;
    std::string organization;
    std::string ownerFingerprint;

    bool listable = true;
    bool tradable = false;

    // Audit
    std::string createdAt;
    std::string updatedAt;
    std::optional<std::string> updatedBy;
};

/**
 * @brief Caller-supplied fields for a new asset
 */
struct NewAssetInput {
    std::string name;
    std::string symbol;
    std::string description;
    std::string organization;
    std::string ownerFingerprint;
};

/**
 * @brief Partial update; only engaged fields are written
 */
struct AssetUpdate {
    std::optional<std::string> name;
    std::optional<std::string> symbol;
    std::optional<std::string> description;
    std::optional<std::string> organization;
    std::optional<bool> listable;
    std::optional<bool> tradable;

    bool empty() const {
        return !name && !symbol && !description && !organization && !listable && !tradable;
    }
};

} // namespace models
} // namespace domain
