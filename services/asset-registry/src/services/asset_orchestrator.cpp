#include "asset_orchestrator.h"
#include "exceptions.h"
#include "transaction_scope.h"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace services {

using domain::models::Asset;
using domain::models::Certificate;

AssetOrchestrator::AssetOrchestrator(common::IQueryExecutor* executor,
                                     AssetRegistry* registry,
                                     CertificateIssuer* issuer,
                                     repositories::ICertificateRepository* certificates,
                                     repositories::IOwnershipTrailRepository* trail,
                                     repositories::IContractRepository* contracts)
    : executor_(executor)
    , registry_(registry)
    , issuer_(issuer)
    , certificates_(certificates)
    , trail_(trail)
    , contracts_(contracts)
{
    if (!executor_ || !registry_ || !issuer_ || !certificates_ || !trail_ || !contracts_) {
        throw std::invalid_argument("AssetOrchestrator: dependencies cannot be nullptr");
    }
}

std::optional<Certificate> AssetOrchestrator::createWithCertificate(const Asset& asset) {
    std::optional<Certificate> issued;

    bool committed = common::runInTransaction(*executor_, [&](common::ITransaction& tx) {
        if (!registry_->insert(tx, asset)) {
            spdlog::warn("[AssetOrchestrator] Asset {} was not inserted", asset.id);
            return false;
        }

        Certificate cert = issuer_->issue(asset.id);

        if (!certificates_->insert(tx, cert)) {
            throw common::TransactionStepException(
                "certificate insert wrote no row for asset " + asset.id);
        }
        if (!trail_->append(tx, cert.id, asset.id, asset.ownerFingerprint)) {
            throw common::TransactionStepException(
                "ownership trail append wrote no row for certificate " + cert.id);
        }

        issued = std::move(cert);
        return true;
    });

    if (!committed) {
        return std::nullopt;
    }

    spdlog::info("[AssetOrchestrator] Created asset {} with certificate {}", asset.id, issued->id);
    return issued;
}

Certificate AssetOrchestrator::transfer(const TransferRequest& request) {
    AssetRegistry::validateFingerprint(request.newOwnerFingerprint, "new owner fingerprint");
    AssetRegistry::validateOrganization(request.newOrganization);

    Asset current = registry_->findByIdAndOrg(request.assetId, request.organization);

    if (request.newOrganization == current.organization &&
        request.newOwnerFingerprint == current.ownerFingerprint) {
        throw common::ValidationException(
            "asset " + request.assetId + " is already held by this organization and owner");
    }

    if (!contracts_->findByAssetId(request.assetId)) {
        throw common::NotFoundException("contract for asset " + request.assetId);
    }

    auto cert = certificates_->findByAssetId(request.assetId);
    if (!cert) {
        throw common::InvalidRecordStateException(
            "asset " + request.assetId + " has no certificate");
    }

    common::runInTransaction(*executor_, [&](common::ITransaction& tx) {
        int affected = registry_->transferOwnership(
            tx, current, request.newOrganization, request.newOwnerFingerprint);
        if (affected != 1) {
            throw common::TransactionStepException(
                "ownership update affected " + std::to_string(affected) +
                " row(s) for asset " + request.assetId);
        }
        if (!trail_->append(tx, cert->id, request.assetId, request.newOwnerFingerprint)) {
            throw common::TransactionStepException(
                "ownership trail append wrote no row for certificate " + cert->id);
        }
        return true;
    });

    spdlog::info("[AssetOrchestrator] Transferred asset {} from {} to {}",
                 request.assetId, current.organization, request.newOrganization);
    return *cert;
}

} // namespace services
