/** @file certificate_repository.cpp
 *  @brief CertificateRepository implementation
 */

#include "certificate_repository.h"
#include "query_helpers.h"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace repositories {

using domain::models::Certificate;

CertificateRepository::CertificateRepository(common::IQueryExecutor* executor)
    : executor_(executor)
{
    if (!executor_) {
        throw std::invalid_argument("CertificateRepository: executor cannot be nullptr");
    }
    spdlog::debug("[CertificateRepository] Initialized");
}

bool CertificateRepository::insert(common::ITransaction& tx, const Certificate& cert) {
    spdlog::debug("[CertificateRepository] Inserting certificate {} for asset {}", cert.id, cert.assetId);

    try {
        int affected = tx.executeCommand(
            "INSERT INTO certificates (id, asset_id, payload, created_at) VALUES ($1, $2, $3, $4)",
            {cert.id, cert.assetId, cert.payload, cert.createdAt});
        return affected == 1;
    } catch (const std::exception& e) {
        spdlog::error("[CertificateRepository] insert failed: {}", e.what());
        throw;
    }
}

std::optional<Certificate> CertificateRepository::findById(const std::string& id) {
    return findOne("id", id);
}

std::optional<Certificate> CertificateRepository::findByAssetId(const std::string& assetId) {
    return findOne("asset_id", assetId);
}

std::optional<Certificate> CertificateRepository::findOne(const std::string& column,
                                                          const std::string& value) {
    // column is one of the two fixed names above, never caller input
    const std::string query =
        "SELECT id, asset_id, payload, " + common::db::utcTimestamp("created_at") +
        " FROM certificates WHERE " + column + " = $1";

    try {
        Json::Value result = executor_->executeQuery(query, {value});
        if (result.isArray() && result.size() > 0) {
            return jsonToModel(result[0]);
        }
        return std::nullopt;
    } catch (const std::exception& e) {
        spdlog::error("[CertificateRepository] lookup by {} failed: {}", column, e.what());
        throw;
    }
}

Certificate CertificateRepository::jsonToModel(const Json::Value& row) {
    Certificate cert;
    cert.id = common::db::getString(row, "id");
    cert.assetId = common::db::getString(row, "asset_id");
    cert.payload = common::db::getString(row, "payload");
    cert.createdAt = common::db::getString(row, "created_at");
    return cert;
}

} // namespace repositories
