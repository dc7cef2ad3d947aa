#pragma once

/**
 * @file asset_repository.h
 * @brief Persistence for the assets table
 *
 * Writes that belong to a multi-step unit of work take the caller's
 * ITransaction; everything else runs as an auto-commit statement on the
 * repository's executor. No caching: every call is a storage round trip.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <json/json.h>
#include "i_query_executor.h"
#include "../domain/models/asset.h"
#include "../domain/models/ordering.h"

namespace repositories {

/**
 * @brief Column that a substring search matches against
 */
enum class AssetSearchField {
    Name,
    Symbol
};

class IAssetRepository {
public:
    virtual ~IAssetRepository() = default;

    /**
     * @return false if the row was not inserted (id already taken)
     */
    virtual bool insert(common::ITransaction& tx, const domain::models::Asset& asset) = 0;

    virtual std::optional<domain::models::Asset> findById(const std::string& id) = 0;

    virtual std::optional<domain::models::Asset> findByIdAndOrg(
        const std::string& id, const std::string& organization) = 0;

    /**
     * @brief Write the engaged fields and stamp updated_at/updated_by
     * @return true on success or when no field is engaged; false if no row has this id
     */
    virtual bool update(const std::string& id, const std::string& updatedBy,
                        const domain::models::AssetUpdate& fields) = 0;

    /**
     * @return false if no row has this id
     */
    virtual bool remove(const std::string& id) = 0;

    /**
     * @brief Move ownership, conditional on the holder read earlier still being current
     *
     * Matches on (id, expectedOrganization, expectedOwner) so that a
     * concurrent transfer committed in between makes this affect zero rows.
     *
     * @return Affected row count
     */
    virtual int transferOwnership(common::ITransaction& tx,
                                  const std::string& id,
                                  const std::string& expectedOrganization,
                                  const std::string& expectedOwner,
                                  const std::string& newOrganization,
                                  const std::string& newOwner,
                                  const std::string& updatedBy) = 0;

    /**
     * @brief One sorted window of all assets; id breaks ties
     */
    virtual std::vector<domain::models::Asset> findAll(
        int64_t offset, int64_t limit,
        domain::models::OrderType order,
        domain::models::AssetSortField sortField) = 0;

    /**
     * @brief Case-insensitive substring match; wildcards in term match literally
     */
    virtual std::vector<domain::models::Asset> search(
        AssetSearchField field, const std::string& term,
        int64_t offset, int64_t limit,
        domain::models::OrderType order) = 0;

    virtual std::vector<domain::models::Asset> findByOwner(
        const std::string& ownerFingerprint,
        int64_t offset, int64_t limit,
        domain::models::OrderType order) = 0;

    virtual int64_t count() = 0;
};

class AssetRepository : public IAssetRepository {
public:
    /**
     * @throws std::invalid_argument if executor is nullptr
     */
    explicit AssetRepository(common::IQueryExecutor* executor);
    ~AssetRepository() override = default;

    bool insert(common::ITransaction& tx, const domain::models::Asset& asset) override;

    std::optional<domain::models::Asset> findById(const std::string& id) override;

    std::optional<domain::models::Asset> findByIdAndOrg(
        const std::string& id, const std::string& organization) override;

    bool update(const std::string& id, const std::string& updatedBy,
                const domain::models::AssetUpdate& fields) override;

    bool remove(const std::string& id) override;

    int transferOwnership(common::ITransaction& tx,
                          const std::string& id,
                          const std::string& expectedOrganization,
                          const std::string& expectedOwner,
                          const std::string& newOrganization,
                          const std::string& newOwner,
                          const std::string& updatedBy) override;

    std::vector<domain::models::Asset> findAll(
        int64_t offset, int64_t limit,
        domain::models::OrderType order,
        domain::models::AssetSortField sortField) override;

    std::vector<domain::models::Asset> search(
        AssetSearchField field, const std::string& term,
        int64_t offset, int64_t limit,
        domain::models::OrderType order) override;

    std::vector<domain::models::Asset> findByOwner(
        const std::string& ownerFingerprint,
        int64_t offset, int64_t limit,
        domain::models::OrderType order) override;

    int64_t count() override;

private:
    common::IQueryExecutor* executor_;

    static std::string selectColumns();
    static std::string orderClause(domain::models::AssetSortField sortField,
                                   domain::models::OrderType order);

    std::vector<domain::models::Asset> queryList(const std::string& query,
                                                 const std::vector<std::string>& params,
                                                 const char* operation);
    std::optional<domain::models::Asset> queryOne(const std::string& query,
                                                  const std::vector<std::string>& params,
                                                  const char* operation);

    domain::models::Asset jsonToModel(const Json::Value& row);
};

} // namespace repositories
