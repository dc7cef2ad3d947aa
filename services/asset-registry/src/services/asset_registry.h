#pragma once

/**
 * @file asset_registry.h
 * @brief Asset validation and persistence entry point
 *
 * create() only builds a validated Asset; persisting it is a separate
 * insert() that the orchestrator runs inside its transaction.
 */

#include <string>
#include "../domain/models/asset.h"
#include "../repositories/asset_repository.h"

namespace services {

class AssetRegistry {
public:
    static constexpr size_t MIN_NAME_LENGTH = 3;
    static constexpr size_t MAX_NAME_LENGTH = 32;
    static constexpr size_t MIN_SYMBOL_LENGTH = 3;
    static constexpr size_t MAX_SYMBOL_LENGTH = 10;
    static constexpr size_t MIN_ORGANIZATION_LENGTH = 32;
    static constexpr size_t MAX_FINGERPRINT_LENGTH = 255;

    /**
     * @throws std::invalid_argument if repository is nullptr
     */
    explicit AssetRegistry(repositories::IAssetRepository* repository);

    /**
     * @brief Validate input and build a new asset
     *
     * Assigns a fresh id and current timestamps. The symbol is uppercased,
     * listable starts true and tradable false.
     *
     * @throws common::ValidationException
     */
    domain::models::Asset create(const domain::models::NewAssetInput& input) const;

    /**
     * @return false if the insert affected no rows
     */
    bool insert(common::ITransaction& tx, const domain::models::Asset& asset);

    /**
     * @throws common::NotFoundException
     */
    domain::models::Asset findById(const std::string& id);

    /**
     * @brief Lookup scoped to the organization currently holding the asset
     * @throws common::NotFoundException
     */
    domain::models::Asset findByIdAndOrg(const std::string& id, const std::string& organization);

    /**
     * @brief Validate and apply a partial update
     *
     * An update with no engaged field succeeds without touching storage.
     *
     * @return false if no asset has this id
     * @throws common::ValidationException
     */
    bool update(const std::string& id, const std::string& updatedBy,
                domain::models::AssetUpdate fields);

    bool remove(const std::string& id);

    /**
     * @return Affected rows; see IAssetRepository::transferOwnership
     */
    int transferOwnership(common::ITransaction& tx,
                          const domain::models::Asset& current,
                          const std::string& newOrganization,
                          const std::string& newOwner);

    // Field rules, shared with request validation elsewhere
    static void validateName(const std::string& name);
    static std::string normalizeSymbol(const std::string& symbol);
    static void validateOrganization(const std::string& organization);
    /// @param what Field name used in the error message
    static void validateFingerprint(const std::string& fingerprint, const std::string& what);

private:
    repositories::IAssetRepository* repository_;
};

} // namespace services
