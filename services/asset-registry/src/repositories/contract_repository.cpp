/** @file contract_repository.cpp
 *  @brief ContractRepository implementation
 */

#include "contract_repository.h"
#include "query_helpers.h"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace repositories {

using domain::models::Contract;

ContractRepository::ContractRepository(common::IQueryExecutor* executor)
    : executor_(executor)
{
    if (!executor_) {
        throw std::invalid_argument("ContractRepository: executor cannot be nullptr");
    }
    spdlog::debug("[ContractRepository] Initialized");
}

bool ContractRepository::insert(const Contract& contract) {
    const std::string query =
        "INSERT INTO contracts (id, asset_id, summary, content, organization, "
        "  updated_by, update_count, created_at, updated_at) "
        "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9)";

    try {
        int affected = executor_->executeCommand(query, {
            contract.id,
            contract.assetId,
            contract.summary,
            contract.content,
            contract.organization,
            contract.updatedBy,
            std::to_string(contract.updateCount),
            contract.createdAt,
            contract.updatedAt
        });
        return affected == 1;
    } catch (const std::exception& e) {
        spdlog::error("[ContractRepository] insert failed: {}", e.what());
        throw;
    }
}

std::optional<Contract> ContractRepository::findByAssetId(const std::string& assetId) {
    const std::string query =
        "SELECT id, asset_id, summary, content, organization, updated_by, update_count, " +
        common::db::utcTimestamp("created_at") + ", " +
        common::db::utcTimestamp("updated_at") +
        " FROM contracts WHERE asset_id = $1";

    try {
        Json::Value result = executor_->executeQuery(query, {assetId});
        if (result.isArray() && result.size() > 0) {
            return jsonToModel(result[0]);
        }
        return std::nullopt;
    } catch (const std::exception& e) {
        spdlog::error("[ContractRepository] findByAssetId failed: {}", e.what());
        throw;
    }
}

Contract ContractRepository::jsonToModel(const Json::Value& row) {
    Contract contract;
    contract.id = common::db::getString(row, "id");
    contract.assetId = common::db::getString(row, "asset_id");
    contract.summary = common::db::getString(row, "summary");
    contract.content = common::db::getString(row, "content");
    contract.organization = common::db::getString(row, "organization");
    contract.updatedBy = common::db::getString(row, "updated_by");
    contract.updateCount = common::db::getInt(row, "update_count");
    contract.createdAt = common::db::getString(row, "created_at");
    contract.updatedAt = common::db::getString(row, "updated_at");
    return contract;
}

} // namespace repositories
