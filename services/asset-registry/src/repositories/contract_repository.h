#pragma once

/**
 * @file contract_repository.h
 * @brief Persistence for the contracts table (one contract per asset)
 */

#include <optional>
#include <string>
#include <json/json.h>
#include "i_query_executor.h"
#include "../domain/models/contract.h"

namespace repositories {

class IContractRepository {
public:
    virtual ~IContractRepository() = default;

    /**
     * @throws common::ConflictException if the asset already has a contract
     */
    virtual bool insert(const domain::models::Contract& contract) = 0;

    virtual std::optional<domain::models::Contract> findByAssetId(const std::string& assetId) = 0;
};

class ContractRepository : public IContractRepository {
public:
    explicit ContractRepository(common::IQueryExecutor* executor);
    ~ContractRepository() override = default;

    bool insert(const domain::models::Contract& contract) override;

    std::optional<domain::models::Contract> findByAssetId(const std::string& assetId) override;

private:
    common::IQueryExecutor* executor_;

    domain::models::Contract jsonToModel(const Json::Value& row);
};

} // namespace repositories
