#pragma once

/**
 * @file service_container.h
 * @brief Owns the pool, repositories, services and handlers of the service
 *
 * Hands out non-owning pointers; everything lives as long as the container.
 */

#include <memory>

struct AppConfig;

// Forward declarations - Infrastructure
namespace common {
    class DbConnectionPool;
    class IQueryExecutor;
}

// Forward declarations - Repositories
namespace repositories {
    class IAssetRepository;
    class ICertificateRepository;
    class IOwnershipTrailRepository;
    class IContractRepository;
}

// Forward declarations - Services
namespace services {
    class CertificateIssuer;
    class AssetRegistry;
    class AssetOrchestrator;
    class AssetQueryService;
    class AssetService;
    class ContractService;
}

// Forward declarations - Handlers
namespace handlers {
    class AssetHandler;
    class ContractHandler;
}

namespace infrastructure {

/**
 * @brief Service container managing all application dependencies
 *
 * Initialization order:
 * 1. Database connection pool
 * 2. Query executor
 * 3. Repositories
 * 4. Certificate issuer (one per process)
 * 5. Services
 * 6. Handlers
 */
class ServiceContainer {
public:
    ServiceContainer();
    ~ServiceContainer();

    // Non-copyable, non-movable
    ServiceContainer(const ServiceContainer&) = delete;
    ServiceContainer& operator=(const ServiceContainer&) = delete;

    /**
     * @brief Initialize all components in dependency order
     * @return true on success, false on failure (details logged)
     */
    bool initialize(const AppConfig& config);

    /**
     * @brief Release all resources (called automatically by destructor)
     */
    void shutdown();

    // --- Infrastructure Accessors ---
    common::DbConnectionPool* dbPool() const;
    common::IQueryExecutor* queryExecutor() const;

    // --- Repository Accessors ---
    repositories::IAssetRepository* assetRepository() const;
    repositories::ICertificateRepository* certificateRepository() const;
    repositories::IOwnershipTrailRepository* ownershipTrailRepository() const;
    repositories::IContractRepository* contractRepository() const;

    // --- Service Accessors ---
    services::CertificateIssuer* certificateIssuer() const;
    services::AssetService* assetService() const;
    services::ContractService* contractService() const;

    // --- Handler Accessors ---
    handlers::AssetHandler* assetHandler() const;
    handlers::ContractHandler* contractHandler() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace infrastructure
