#include "asset_service.h"
#include "exceptions.h"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace services {

using domain::models::Asset;

AssetService::AssetService(AssetRegistry* registry,
                           AssetOrchestrator* orchestrator,
                           AssetQueryService* queries,
                           repositories::ICertificateRepository* certificates,
                           repositories::IOwnershipTrailRepository* trail)
    : registry_(registry)
    , orchestrator_(orchestrator)
    , queries_(queries)
    , certificates_(certificates)
    , trail_(trail)
{
    if (!registry_ || !orchestrator_ || !queries_ || !certificates_ || !trail_) {
        throw std::invalid_argument("AssetService: dependencies cannot be nullptr");
    }
}

std::string AssetService::createAsset(const domain::models::NewAssetInput& input) {
    if (input.ownerFingerprint.empty()) {
        throw common::ValidationException("owner fingerprint is required");
    }

    Asset asset = registry_->create(input);
    auto cert = orchestrator_->createWithCertificate(asset);
    if (!cert) {
        throw common::TransactionStepException("asset " + asset.id + " was not inserted");
    }
    return asset.id;
}

bool AssetService::updateAsset(const std::string& assetId,
                               const std::string& organization,
                               const std::string& updatedBy,
                               const domain::models::AssetUpdate& fields) {
    if (updatedBy.empty()) {
        throw common::ValidationException("updated_by is required");
    }
    if (fields.organization) {
        throw common::ValidationException("organization can only change through a transfer");
    }
    if (fields.empty()) {
        throw common::ValidationException("at least one field must be supplied");
    }

    registry_->findByIdAndOrg(assetId, organization);

    bool updated = registry_->update(assetId, updatedBy, fields);
    if (updated) {
        spdlog::info("[AssetService] Updated asset {} by {}", assetId, updatedBy);
    }
    return updated;
}

bool AssetService::deleteAsset(const std::string& assetId, const std::string& organization) {
    registry_->findByIdAndOrg(assetId, organization);

    bool deleted = registry_->remove(assetId);
    if (deleted) {
        spdlog::info("[AssetService] Deleted asset {}", assetId);
    }
    return deleted;
}

Asset AssetService::getAssetById(const std::string& assetId) {
    return registry_->findById(assetId);
}

AssetPage AssetService::getPaginatedAssets(int64_t offset, int64_t limit,
                                           domain::models::OrderType order,
                                           domain::models::AssetSortField sortField) {
    AssetPage page;
    page.assets = queries_->page(offset, limit, order, sortField);
    page.offset = offset;
    page.total = static_cast<int64_t>(page.assets.size());
    return page;
}

AssetStream AssetService::getStreamedAssets(int64_t offset, int64_t limit,
                                            domain::models::OrderType order,
                                            domain::models::AssetSortField sortField) {
    return queries_->stream(offset, limit, order, sortField);
}

AssetPage AssetService::searchAssets(repositories::AssetSearchField field, const std::string& term,
                                     int64_t offset, int64_t limit,
                                     domain::models::OrderType order) {
    AssetPage page;
    page.assets = queries_->search(field, term, offset, limit, order);
    page.offset = offset;
    page.total = static_cast<int64_t>(page.assets.size());
    return page;
}

std::string AssetService::transferAsset(const TransferRequest& request) {
    return orchestrator_->transfer(request).id;
}

domain::models::Certificate AssetService::findCertificateByAsset(const std::string& assetId) {
    auto cert = certificates_->findByAssetId(assetId);
    if (!cert) {
        throw common::NotFoundException("certificate for asset " + assetId);
    }
    return *cert;
}

std::vector<domain::models::OwnershipTrailEntry> AssetService::getCertificateTrail(
    const std::string& certificateId) {
    if (!certificates_->findById(certificateId)) {
        throw common::NotFoundException("certificate " + certificateId);
    }
    return trail_->listByCertificate(certificateId);
}

} // namespace services
