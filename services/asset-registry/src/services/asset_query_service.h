#pragma once

/**
 * @file asset_query_service.h
 * @brief Paged and streamed reads over the asset catalogue
 *
 * Every request is validated before storage is touched.
 */

#include <cstdint>
#include <string>
#include <vector>
#include "asset_stream.h"
#include "../domain/models/ordering.h"
#include "../repositories/asset_repository.h"

namespace services {

class AssetQueryService {
public:
    static constexpr int64_t MAX_PAGE_LIMIT = 100;
    static constexpr int64_t MAX_BATCH_SIZE = 1000;
    static constexpr int64_t BATCH_MULTIPLIER = 10;
    static constexpr int64_t DEFAULT_MAX_STREAM_OFFSET = 9999999;

    /**
     * @throws std::invalid_argument if repository is nullptr or maxStreamOffset < 1
     */
    explicit AssetQueryService(repositories::IAssetRepository* repository,
                               int64_t maxStreamOffset = DEFAULT_MAX_STREAM_OFFSET);

    /**
     * @brief One window of assets, sorted by sortField then id
     * @throws common::ValidationException if offset < 0 or limit is outside [1, 100]
     */
    std::vector<domain::models::Asset> page(
        int64_t offset, int64_t limit,
        domain::models::OrderType order,
        domain::models::AssetSortField sortField = domain::models::AssetSortField::Name);

    /**
     * @brief Stream of items of at most limit assets each
     *
     * Storage is read min(limit * 10, 1000) rows at a time.
     *
     * @throws common::ValidationException as page()
     */
    AssetStream stream(
        int64_t offset, int64_t limit,
        domain::models::OrderType order,
        domain::models::AssetSortField sortField = domain::models::AssetSortField::Name);

    /**
     * @throws common::ValidationException if term is blank or paging is invalid
     */
    std::vector<domain::models::Asset> search(
        repositories::AssetSearchField field, const std::string& term,
        int64_t offset, int64_t limit,
        domain::models::OrderType order);

    /**
     * @throws common::ValidationException if owner is empty or paging is invalid
     */
    std::vector<domain::models::Asset> findByOwner(
        const std::string& ownerFingerprint,
        int64_t offset, int64_t limit,
        domain::models::OrderType order);

    int64_t count();

    static void validatePaging(int64_t offset, int64_t limit);

    static int64_t batchSizeFor(int64_t limit);

private:
    repositories::IAssetRepository* repository_;
    int64_t maxStreamOffset_;
};

} // namespace services
