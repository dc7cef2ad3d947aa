#include "asset_registry.h"
#include "../crypto/key_generator.h"
#include "exceptions.h"
#include "UuidUtil.hpp"
#include "registry/utils/string_utils.h"
#include "registry/utils/time_utils.h"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace services {

using domain::models::Asset;
using domain::models::AssetUpdate;
using domain::models::NewAssetInput;

AssetRegistry::AssetRegistry(repositories::IAssetRepository* repository)
    : repository_(repository)
{
    if (!repository_) {
        throw std::invalid_argument("AssetRegistry: repository cannot be nullptr");
    }
}

void AssetRegistry::validateName(const std::string& name) {
    if (name.size() < MIN_NAME_LENGTH || name.size() > MAX_NAME_LENGTH) {
        throw common::ValidationException(
            "name must be between " + std::to_string(MIN_NAME_LENGTH) + " and " +
            std::to_string(MAX_NAME_LENGTH) + " characters");
    }
}

std::string AssetRegistry::normalizeSymbol(const std::string& symbol) {
    if (symbol.size() < MIN_SYMBOL_LENGTH || symbol.size() > MAX_SYMBOL_LENGTH) {
        throw common::ValidationException(
            "symbol must be between " + std::to_string(MIN_SYMBOL_LENGTH) + " and " +
            std::to_string(MAX_SYMBOL_LENGTH) + " characters");
    }
    if (registry::utils::containsWhitespace(symbol)) {
        throw common::ValidationException("symbol must not contain whitespace");
    }
    return registry::utils::toUpper(symbol);
}

void AssetRegistry::validateOrganization(const std::string& organization) {
    if (organization.size() < MIN_ORGANIZATION_LENGTH ||
        !shared::util::UuidUtil::isValid(organization)) {
        throw common::ValidationException("organization must be a UUID");
    }
}

void AssetRegistry::validateFingerprint(const std::string& fingerprint, const std::string& what) {
    if (fingerprint.empty()) {
        throw common::ValidationException(what + " is required");
    }
    if (fingerprint.size() > MAX_FINGERPRINT_LENGTH) {
        throw common::ValidationException(
            what + " must be at most " + std::to_string(MAX_FINGERPRINT_LENGTH) + " characters");
    }
}

Asset AssetRegistry::create(const NewAssetInput& input) const {
    validateName(input.name);
    std::string symbol = normalizeSymbol(input.symbol);
    validateOrganization(input.organization);
    validateFingerprint(input.ownerFingerprint, "owner fingerprint");

    Asset asset;
    asset.id = crypto::generateUniqueKey(crypto::DOMAIN_KEY_SIZE);
    asset.name = input.name;
    asset.symbol = symbol;
    asset.description = input.description;
    asset.organization = input.organization;
    asset.ownerFingerprint = input.ownerFingerprint;
    asset.listable = true;
    asset.tradable = false;
    asset.createdAt = registry::utils::nowIso8601();
    asset.updatedAt = asset.createdAt;
    asset.updatedBy = input.ownerFingerprint;
    return asset;
}

bool AssetRegistry::insert(common::ITransaction& tx, const Asset& asset) {
    return repository_->insert(tx, asset);
}

Asset AssetRegistry::findById(const std::string& id) {
    auto asset = repository_->findById(id);
    if (!asset) {
        throw common::NotFoundException("asset " + id);
    }
    return *asset;
}

Asset AssetRegistry::findByIdAndOrg(const std::string& id, const std::string& organization) {
    auto asset = repository_->findByIdAndOrg(id, organization);
    if (!asset) {
        throw common::NotFoundException("asset " + id + " in organization " + organization);
    }
    return *asset;
}

bool AssetRegistry::update(const std::string& id, const std::string& updatedBy, AssetUpdate fields) {
    if (fields.name) validateName(*fields.name);
    if (fields.symbol) fields.symbol = normalizeSymbol(*fields.symbol);
    if (fields.organization) validateOrganization(*fields.organization);
    validateFingerprint(updatedBy, "updater fingerprint");

    return repository_->update(id, updatedBy, fields);
}

bool AssetRegistry::remove(const std::string& id) {
    return repository_->remove(id);
}

int AssetRegistry::transferOwnership(common::ITransaction& tx,
                                     const Asset& current,
                                     const std::string& newOrganization,
                                     const std::string& newOwner) {
    return repository_->transferOwnership(tx, current.id,
                                          current.organization, current.ownerFingerprint,
                                          newOrganization, newOwner,
                                          newOwner);
}

} // namespace services
