#include "contract_service.h"
#include "../crypto/key_generator.h"
#include "exceptions.h"
#include "registry/utils/string_utils.h"
#include "registry/utils/time_utils.h"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace services {

using domain::models::Contract;

ContractService::ContractService(repositories::IContractRepository* repository,
                                 AssetRegistry* registry)
    : repository_(repository)
    , registry_(registry)
{
    if (!repository_ || !registry_) {
        throw std::invalid_argument("ContractService: dependencies cannot be nullptr");
    }
}

Contract ContractService::createContract(const domain::models::NewContractInput& input) {
    if (input.assetId.empty()) {
        throw common::ValidationException("asset id is required");
    }
    if (registry::utils::trim(input.summary).empty()) {
        throw common::ValidationException("summary is required");
    }
    if (registry::utils::trim(input.content).empty()) {
        throw common::ValidationException("content is required");
    }
    AssetRegistry::validateFingerprint(input.userFingerprint, "user fingerprint");
    AssetRegistry::validateOrganization(input.organization);

    registry_->findById(input.assetId);

    Contract contract;
    contract.id = crypto::generateUniqueKey(crypto::DOMAIN_KEY_SIZE);
    contract.assetId = input.assetId;
    contract.summary = input.summary;
    contract.content = input.content;
    contract.organization = input.organization;
    contract.updatedBy = input.userFingerprint;
    contract.updateCount = 0;
    contract.createdAt = registry::utils::nowIso8601();
    contract.updatedAt = contract.createdAt;

    if (!repository_->insert(contract)) {
        throw common::DatabaseException("contract insert wrote no row for asset " + input.assetId);
    }

    spdlog::info("[ContractService] Created contract {} for asset {}", contract.id, contract.assetId);
    return contract;
}

Contract ContractService::findContract(const std::string& assetId) {
    auto contract = repository_->findByAssetId(assetId);
    if (!contract) {
        throw common::NotFoundException("contract for asset " + assetId);
    }
    return *contract;
}

} // namespace services
