#include "asset_query_service.h"
#include "exceptions.h"
#include "registry/utils/string_utils.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

namespace services {

using domain::models::Asset;
using domain::models::AssetSortField;
using domain::models::OrderType;

AssetQueryService::AssetQueryService(repositories::IAssetRepository* repository,
                                     int64_t maxStreamOffset)
    : repository_(repository)
    , maxStreamOffset_(maxStreamOffset)
{
    if (!repository_) {
        throw std::invalid_argument("AssetQueryService: repository cannot be nullptr");
    }
    if (maxStreamOffset_ < 1) {
        throw std::invalid_argument("AssetQueryService: max stream offset must be positive");
    }
}

void AssetQueryService::validatePaging(int64_t offset, int64_t limit) {
    if (offset < 0) {
        throw common::ValidationException("offset must not be negative");
    }
    if (limit < 1 || limit > MAX_PAGE_LIMIT) {
        throw common::ValidationException(
            "limit must be between 1 and " + std::to_string(MAX_PAGE_LIMIT));
    }
}

int64_t AssetQueryService::batchSizeFor(int64_t limit) {
    return std::min(limit * BATCH_MULTIPLIER, MAX_BATCH_SIZE);
}

std::vector<Asset> AssetQueryService::page(int64_t offset, int64_t limit,
                                           OrderType order, AssetSortField sortField) {
    validatePaging(offset, limit);
    return repository_->findAll(offset, limit, order, sortField);
}

AssetStream AssetQueryService::stream(int64_t offset, int64_t limit,
                                      OrderType order, AssetSortField sortField) {
    validatePaging(offset, limit);

    int64_t batchSize = batchSizeFor(limit);
    spdlog::debug("[AssetQueryService] Stream from offset {} (item limit {}, batch {}, {})",
                  offset, limit, batchSize, domain::models::toString(order));

    auto* repository = repository_;
    auto fetcher = [repository, order, sortField](int64_t windowOffset, int64_t windowLimit) {
        return repository->findAll(windowOffset, windowLimit, order, sortField);
    };
    return AssetStream(fetcher, offset, limit, batchSize, maxStreamOffset_);
}

std::vector<Asset> AssetQueryService::search(repositories::AssetSearchField field,
                                             const std::string& term,
                                             int64_t offset, int64_t limit,
                                             OrderType order) {
    std::string trimmed = registry::utils::trim(term);
    if (trimmed.empty()) {
        throw common::ValidationException("search term is required");
    }
    validatePaging(offset, limit);
    return repository_->search(field, trimmed, offset, limit, order);
}

std::vector<Asset> AssetQueryService::findByOwner(const std::string& ownerFingerprint,
                                                  int64_t offset, int64_t limit,
                                                  OrderType order) {
    if (ownerFingerprint.empty()) {
        throw common::ValidationException("owner fingerprint is required");
    }
    validatePaging(offset, limit);
    return repository_->findByOwner(ownerFingerprint, offset, limit, order);
}

int64_t AssetQueryService::count() {
    return repository_->count();
}

} // namespace services
