#pragma once

/**
 * @file ownership_trail_repository.h
 * @brief Append-only ownership ledger keyed by certificate id
 *
 * Entries are written only inside a caller-supplied transaction and are
 * never updated or deleted.
 */

#include <string>
#include <vector>
#include <json/json.h>
#include "i_query_executor.h"
#include "../domain/models/certificate.h"

namespace repositories {

class IOwnershipTrailRepository {
public:
    virtual ~IOwnershipTrailRepository() = default;

    /**
     * @return false if the insert affected zero rows; callers abort their transaction
     */
    virtual bool append(common::ITransaction& tx,
                        const std::string& certificateId,
                        const std::string& assetId,
                        const std::string& newOwnerFingerprint) = 0;

    /**
     * @return Entries ordered by transferred_on ascending
     */
    virtual std::vector<domain::models::OwnershipTrailEntry> listByCertificate(
        const std::string& certificateId) = 0;
};

class OwnershipTrailRepository : public IOwnershipTrailRepository {
public:
    explicit OwnershipTrailRepository(common::IQueryExecutor* executor);
    ~OwnershipTrailRepository() override = default;

    bool append(common::ITransaction& tx,
                const std::string& certificateId,
                const std::string& assetId,
                const std::string& newOwnerFingerprint) override;

    std::vector<domain::models::OwnershipTrailEntry> listByCertificate(
        const std::string& certificateId) override;

private:
    common::IQueryExecutor* executor_;
};

} // namespace repositories
