#pragma once

/**
 * @file asset_service.h
 * @brief Caller-facing asset operations
 *
 * Applies request-level rules (ownership scope, required fingerprints)
 * and delegates to the registry, the orchestrator and the query service.
 */

#include <cstdint>
#include <string>
#include <vector>
#include "asset_orchestrator.h"
#include "asset_query_service.h"
#include "asset_registry.h"
#include "../repositories/certificate_repository.h"
#include "../repositories/ownership_trail_repository.h"

namespace services {

/**
 * @brief GetPaginatedAssets result; total counts the assets in this page
 */
struct AssetPage {
    std::vector<domain::models::Asset> assets;
    int64_t offset = 0;
    int64_t total = 0;
};

class AssetService {
public:
    /**
     * @throws std::invalid_argument if any dependency is nullptr
     */
    AssetService(AssetRegistry* registry,
                 AssetOrchestrator* orchestrator,
                 AssetQueryService* queries,
                 repositories::ICertificateRepository* certificates,
                 repositories::IOwnershipTrailRepository* trail);

    /**
     * @brief Register an asset and issue its certificate atomically
     * @return New asset id
     * @throws common::ValidationException, common::TransactionStepException
     */
    std::string createAsset(const domain::models::NewAssetInput& input);

    /**
     * @brief Edit descriptive fields of an asset held by organization
     *
     * Ownership is changed by transferAsset() only, so fields.organization
     * must be disengaged.
     *
     * @throws common::ValidationException if no field is supplied
     * @throws common::NotFoundException if the asset is not held by organization
     */
    bool updateAsset(const std::string& assetId,
                     const std::string& organization,
                     const std::string& updatedBy,
                     const domain::models::AssetUpdate& fields);

    /**
     * @throws common::NotFoundException if the asset is not held by organization
     */
    bool deleteAsset(const std::string& assetId, const std::string& organization);

    domain::models::Asset getAssetById(const std::string& assetId);

    AssetPage getPaginatedAssets(int64_t offset, int64_t limit,
                                 domain::models::OrderType order,
                                 domain::models::AssetSortField sortField =
                                     domain::models::AssetSortField::Name);

    AssetStream getStreamedAssets(int64_t offset, int64_t limit,
                                  domain::models::OrderType order,
                                  domain::models::AssetSortField sortField =
                                      domain::models::AssetSortField::Name);

    AssetPage searchAssets(repositories::AssetSearchField field, const std::string& term,
                           int64_t offset, int64_t limit,
                           domain::models::OrderType order);

    /**
     * @return Id of the asset's certificate
     */
    std::string transferAsset(const TransferRequest& request);

    /**
     * @throws common::NotFoundException
     */
    domain::models::Certificate findCertificateByAsset(const std::string& assetId);

    /**
     * @brief Ownership history, oldest first
     * @throws common::NotFoundException if the certificate does not exist
     */
    std::vector<domain::models::OwnershipTrailEntry> getCertificateTrail(
        const std::string& certificateId);

private:
    AssetRegistry* registry_;
    AssetOrchestrator* orchestrator_;
    AssetQueryService* queries_;
    repositories::ICertificateRepository* certificates_;
    repositories::IOwnershipTrailRepository* trail_;
};

} // namespace services
