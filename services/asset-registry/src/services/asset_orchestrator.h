#pragma once

/**
 * @file asset_orchestrator.h
 * @brief Multi-step asset writes that must commit or roll back together
 *
 * Creation: asset row, certificate issuance, certificate row, initial
 * ownership trail entry. Transfer: ownership update and trail entry.
 * Each runs in one storage transaction; any failed step leaves storage
 * unchanged.
 */

#include <optional>
#include <string>
#include "i_query_executor.h"
#include "asset_registry.h"
#include "certificate_issuer.h"
#include "../repositories/certificate_repository.h"
#include "../repositories/contract_repository.h"
#include "../repositories/ownership_trail_repository.h"

namespace services {

/**
 * @brief Caller-supplied transfer parameters
 */
struct TransferRequest {
    std::string assetId;
    std::string organization;      ///< Organization currently holding the asset
    std::string newOrganization;
    std::string newOwnerFingerprint;
};

class AssetOrchestrator {
public:
    /**
     * @throws std::invalid_argument if any dependency is nullptr
     */
    AssetOrchestrator(common::IQueryExecutor* executor,
                      AssetRegistry* registry,
                      CertificateIssuer* issuer,
                      repositories::ICertificateRepository* certificates,
                      repositories::IOwnershipTrailRepository* trail,
                      repositories::IContractRepository* contracts);

    /**
     * @brief Persist a validated asset together with its certificate
     *
     * @return The issued certificate, or std::nullopt if the asset insert
     *         affected no rows (nothing is issued or written then)
     * @throws common::IssuanceException, common::TransactionStepException,
     *         common::ConflictException, common::StorageUnavailableException
     */
    std::optional<domain::models::Certificate> createWithCertificate(
        const domain::models::Asset& asset);

    /**
     * @brief Move an asset to a new organization and owner
     *
     * Preconditions are checked before the transaction opens: the asset
     * is held by request.organization, the new holder differs from the
     * current one, a contract exists and a certificate exists.
     *
     * @return The asset's certificate (unchanged)
     * @throws common::NotFoundException if the asset is not held by the
     *         organization or has no contract
     * @throws common::ValidationException if the new holder equals the current one
     * @throws common::InvalidRecordStateException if the asset has no certificate
     * @throws common::TransactionStepException if the asset changed hands
     *         concurrently or the trail append wrote nothing
     */
    domain::models::Certificate transfer(const TransferRequest& request);

private:
    common::IQueryExecutor* executor_;
    AssetRegistry* registry_;
    CertificateIssuer* issuer_;
    repositories::ICertificateRepository* certificates_;
    repositories::IOwnershipTrailRepository* trail_;
    repositories::IContractRepository* contracts_;
};

} // namespace services
