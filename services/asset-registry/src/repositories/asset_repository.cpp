/** @file asset_repository.cpp
 *  @brief AssetRepository implementation
 */

#include "asset_repository.h"
#include "query_helpers.h"
#include <spdlog/spdlog.h>
#include <sstream>
#include <stdexcept>

namespace repositories {

using domain::models::Asset;
using domain::models::AssetSortField;
using domain::models::AssetUpdate;
using domain::models::OrderType;

AssetRepository::AssetRepository(common::IQueryExecutor* executor)
    : executor_(executor)
{
    if (!executor_) {
        throw std::invalid_argument("AssetRepository: executor cannot be nullptr");
    }
    spdlog::debug("[AssetRepository] Initialized (DB type: {})", executor_->getDatabaseType());
}

std::string AssetRepository::selectColumns() {
    return "SELECT id, name, symbol, description, organization, owner_fp, "
           "listable, tradable, " +
           common::db::utcTimestamp("created_at") + ", " +
           common::db::utcTimestamp("updated_at") + ", updated_by "
           "FROM assets";
}

std::string AssetRepository::orderClause(AssetSortField sortField, OrderType order) {
    std::string dir = domain::models::toSql(order);
    return std::string(" ORDER BY ") + domain::models::sortColumn(sortField) + " " + dir +
           ", id " + dir;
}

bool AssetRepository::insert(common::ITransaction& tx, const Asset& asset) {
    spdlog::debug("[AssetRepository] Inserting asset {}", asset.id);

    const std::string query =
        "INSERT INTO assets (id, name, symbol, description, organization, owner_fp, "
        "  listable, tradable, created_at, updated_at, updated_by) "
        "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11) "
        "ON CONFLICT (id) DO NOTHING";

    std::vector<std::string> params = {
        asset.id,
        asset.name,
        asset.symbol,
        asset.description,
        asset.organization,
        asset.ownerFingerprint,
        common::db::boolParam(asset.listable),
        common::db::boolParam(asset.tradable),
        asset.createdAt,
        asset.updatedAt,
        asset.updatedBy.value_or("")
    };

    try {
        return tx.executeCommand(query, params) == 1;
    } catch (const std::exception& e) {
        spdlog::error("[AssetRepository] insert failed: {}", e.what());
        throw;
    }
}

std::optional<Asset> AssetRepository::findById(const std::string& id) {
    return queryOne(selectColumns() + " WHERE id = $1", {id}, "findById");
}

std::optional<Asset> AssetRepository::findByIdAndOrg(const std::string& id,
                                                     const std::string& organization) {
    return queryOne(selectColumns() + " WHERE id = $1 AND organization = $2",
                    {id, organization}, "findByIdAndOrg");
}

bool AssetRepository::update(const std::string& id, const std::string& updatedBy,
                             const AssetUpdate& fields) {
    if (fields.empty()) {
        spdlog::debug("[AssetRepository] update {}: no fields supplied, nothing to do", id);
        return true;
    }

    std::vector<std::string> setClauses;
    std::vector<std::string> params;

    auto bind = [&](const char* column, const std::string& value) {
        params.push_back(value);
        setClauses.push_back(std::string(column) + " = $" + std::to_string(params.size()));
    };

    if (fields.name) bind("name", *fields.name);
    if (fields.symbol) bind("symbol", *fields.symbol);
    if (fields.description) bind("description", *fields.description);
    if (fields.organization) bind("organization", *fields.organization);
    if (fields.listable) bind("listable", common::db::boolParam(*fields.listable));
    if (fields.tradable) bind("tradable", common::db::boolParam(*fields.tradable));
    bind("updated_by", updatedBy);

    std::ostringstream sql;
    sql << "UPDATE assets SET ";
    for (const auto& clause : setClauses) {
        sql << clause << ", ";
    }
    params.push_back(id);
    sql << "updated_at = NOW() WHERE id = $" << params.size();

    try {
        int affected = executor_->executeCommand(sql.str(), params);
        spdlog::debug("[AssetRepository] update {}: {} row(s)", id, affected);
        return affected > 0;
    } catch (const std::exception& e) {
        spdlog::error("[AssetRepository] update failed: {}", e.what());
        throw;
    }
}

bool AssetRepository::remove(const std::string& id) {
    try {
        int affected = executor_->executeCommand("DELETE FROM assets WHERE id = $1", {id});
        return affected > 0;
    } catch (const std::exception& e) {
        spdlog::error("[AssetRepository] remove failed: {}", e.what());
        throw;
    }
}

int AssetRepository::transferOwnership(common::ITransaction& tx,
                                       const std::string& id,
                                       const std::string& expectedOrganization,
                                       const std::string& expectedOwner,
                                       const std::string& newOrganization,
                                       const std::string& newOwner,
                                       const std::string& updatedBy) {
    const std::string query =
        "UPDATE assets SET organization = $1, owner_fp = $2, updated_by = $3, updated_at = NOW() "
        "WHERE id = $4 AND organization = $5 AND owner_fp = $6";

    try {
        return tx.executeCommand(query, {
            newOrganization, newOwner, updatedBy, id, expectedOrganization, expectedOwner
        });
    } catch (const std::exception& e) {
        spdlog::error("[AssetRepository] transferOwnership failed: {}", e.what());
        throw;
    }
}

std::vector<Asset> AssetRepository::findAll(int64_t offset, int64_t limit,
                                            OrderType order, AssetSortField sortField) {
    std::string query = selectColumns() + orderClause(sortField, order) +
                        common::db::paginationClause(limit, offset);
    return queryList(query, {}, "findAll");
}

std::vector<Asset> AssetRepository::search(AssetSearchField field, const std::string& term,
                                           int64_t offset, int64_t limit, OrderType order) {
    const char* column = field == AssetSearchField::Symbol ? "symbol" : "name";
    AssetSortField sortField = field == AssetSearchField::Symbol
        ? AssetSortField::Symbol : AssetSortField::Name;

    std::string query = selectColumns() + " WHERE " + column + " ILIKE $1 ESCAPE '\\'" +
                        orderClause(sortField, order) +
                        common::db::paginationClause(limit, offset);
    return queryList(query, {common::db::containsPattern(term)}, "search");
}

std::vector<Asset> AssetRepository::findByOwner(const std::string& ownerFingerprint,
                                                int64_t offset, int64_t limit, OrderType order) {
    std::string query = selectColumns() + " WHERE owner_fp = $1" +
                        orderClause(AssetSortField::Name, order) +
                        common::db::paginationClause(limit, offset);
    return queryList(query, {ownerFingerprint}, "findByOwner");
}

int64_t AssetRepository::count() {
    try {
        return common::db::scalarToInt64(executor_->executeScalar("SELECT COUNT(*) FROM assets"));
    } catch (const std::exception& e) {
        spdlog::error("[AssetRepository] count failed: {}", e.what());
        throw;
    }
}

std::vector<Asset> AssetRepository::queryList(const std::string& query,
                                              const std::vector<std::string>& params,
                                              const char* operation) {
    try {
        Json::Value result = executor_->executeQuery(query, params);

        std::vector<Asset> items;
        if (result.isArray()) {
            items.reserve(result.size());
            for (const auto& row : result) {
                items.push_back(jsonToModel(row));
            }
        }
        return items;
    } catch (const std::exception& e) {
        spdlog::error("[AssetRepository] {} failed: {}", operation, e.what());
        throw;
    }
}

std::optional<Asset> AssetRepository::queryOne(const std::string& query,
                                               const std::vector<std::string>& params,
                                               const char* operation) {
    try {
        Json::Value result = executor_->executeQuery(query, params);
        if (result.isArray() && result.size() > 0) {
            return jsonToModel(result[0]);
        }
        return std::nullopt;
    } catch (const std::exception& e) {
        spdlog::error("[AssetRepository] {} failed: {}", operation, e.what());
        throw;
    }
}

Asset AssetRepository::jsonToModel(const Json::Value& row) {
    Asset asset;
    asset.id = common::db::getString(row, "id");
    asset.name = common::db::getString(row, "name");
    asset.symbol = common::db::getString(row, "symbol");
    asset.description = common::db::getString(row, "description");
    asset.organization = common::db::getString(row, "organization");
    asset.ownerFingerprint = common::db::getString(row, "owner_fp");
    asset.listable = common::db::getBool(row, "listable", true);
    asset.tradable = common::db::getBool(row, "tradable", false);
    asset.createdAt = common::db::getString(row, "created_at");
    asset.updatedAt = common::db::getString(row, "updated_at");
    asset.updatedBy = common::db::getOptionalString(row, "updated_by");
    return asset;
}

} // namespace repositories
