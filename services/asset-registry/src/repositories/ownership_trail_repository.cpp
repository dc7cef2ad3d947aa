/** @file ownership_trail_repository.cpp
 *  @brief OwnershipTrailRepository implementation
 */

#include "ownership_trail_repository.h"
#include "query_helpers.h"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace repositories {

OwnershipTrailRepository::OwnershipTrailRepository(common::IQueryExecutor* executor)
    : executor_(executor)
{
    if (!executor_) {
        throw std::invalid_argument("OwnershipTrailRepository: executor cannot be nullptr");
    }
    spdlog::debug("[OwnershipTrailRepository] Initialized");
}

bool OwnershipTrailRepository::append(common::ITransaction& tx,
                                      const std::string& certificateId,
                                      const std::string& assetId,
                                      const std::string& newOwnerFingerprint) {
    // clock_timestamp() rather than NOW(): entries written in one transaction keep distinct times
    const std::string query =
        "INSERT INTO ownership_trail (certificate_id, asset_id, user_fp, transferred_on) "
        "VALUES ($1, $2, $3, clock_timestamp())";

    try {
        int affected = tx.executeCommand(query, {certificateId, assetId, newOwnerFingerprint});
        spdlog::debug("[OwnershipTrailRepository] append cert={} owner={}: {} row(s)",
                      certificateId, newOwnerFingerprint, affected);
        return affected > 0;
    } catch (const std::exception& e) {
        spdlog::error("[OwnershipTrailRepository] append failed: {}", e.what());
        throw;
    }
}

std::vector<domain::models::OwnershipTrailEntry> OwnershipTrailRepository::listByCertificate(
    const std::string& certificateId) {

    const std::string query =
        "SELECT certificate_id, asset_id, user_fp, " +
        common::db::utcTimestamp("transferred_on") +
        " FROM ownership_trail WHERE certificate_id = $1"
        " ORDER BY ownership_trail.transferred_on ASC, seq ASC";

    try {
        Json::Value result = executor_->executeQuery(query, {certificateId});

        std::vector<domain::models::OwnershipTrailEntry> entries;
        for (const auto& row : result) {
            domain::models::OwnershipTrailEntry entry;
            entry.certificateId = common::db::getString(row, "certificate_id");
            entry.assetId = common::db::getString(row, "asset_id");
            entry.newOwnerFingerprint = common::db::getString(row, "user_fp");
            entry.transferredOn = common::db::getString(row, "transferred_on");
            entries.push_back(std::move(entry));
        }
        return entries;
    } catch (const std::exception& e) {
        spdlog::error("[OwnershipTrailRepository] listByCertificate failed: {}", e.what());
        throw;
    }
}

} // namespace repositories
