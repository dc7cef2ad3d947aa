#pragma once

/**
 * @file contract_service.h
 * @brief Contract creation and lookup (one contract per asset)
 */

#include "asset_registry.h"
#include "../domain/models/contract.h"
#include "../repositories/contract_repository.h"

namespace services {

class ContractService {
public:
    /**
     * @throws std::invalid_argument if any dependency is nullptr
     */
    ContractService(repositories::IContractRepository* repository, AssetRegistry* registry);

    /**
     * @throws common::ValidationException for blank fields or a malformed organization
     * @throws common::NotFoundException if the asset does not exist
     * @throws common::ConflictException if the asset already has a contract
     */
    domain::models::Contract createContract(const domain::models::NewContractInput& input);

    /**
     * @throws common::NotFoundException
     */
    domain::models::Contract findContract(const std::string& assetId);

private:
    repositories::IContractRepository* repository_;
    AssetRegistry* registry_;
};

} // namespace services
