#pragma once

/**
 * @file certificate_repository.h
 * @brief Persistence for the certificates table (insert-only)
 */

#include <optional>
#include <string>
#include <json/json.h>
#include "i_query_executor.h"
#include "../domain/models/certificate.h"

namespace repositories {

class ICertificateRepository {
public:
    virtual ~ICertificateRepository() = default;

    /**
     * @brief Insert within the caller's transaction
     * @return false if no row was written
     * @throws common::ConflictException if the asset already has a certificate
     */
    virtual bool insert(common::ITransaction& tx, const domain::models::Certificate& cert) = 0;

    virtual std::optional<domain::models::Certificate> findById(const std::string& id) = 0;

    virtual std::optional<domain::models::Certificate> findByAssetId(const std::string& assetId) = 0;
};

class CertificateRepository : public ICertificateRepository {
public:
    explicit CertificateRepository(common::IQueryExecutor* executor);
    ~CertificateRepository() override = default;

    bool insert(common::ITransaction& tx, const domain::models::Certificate& cert) override;

    std::optional<domain::models::Certificate> findById(const std::string& id) override;

    std::optional<domain::models::Certificate> findByAssetId(const std::string& assetId) override;

private:
    common::IQueryExecutor* executor_;

    std::optional<domain::models::Certificate> findOne(const std::string& column,
                                                       const std::string& value);
    domain::models::Certificate jsonToModel(const Json::Value& row);
};

} // namespace repositories
