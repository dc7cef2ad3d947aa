/**
 * @file service_container.cpp
 * @brief ServiceContainer implementation
 */

#include "service_container.h"
#include "app_config.h"

// Infrastructure
#include "db_connection_pool.h"
#include "postgresql_query_executor.h"

// Repositories
#include "../repositories/asset_repository.h"
#include "../repositories/certificate_repository.h"
#include "../repositories/ownership_trail_repository.h"
#include "../repositories/contract_repository.h"

// Services
#include "../services/certificate_issuer.h"
#include "../services/asset_registry.h"
#include "../services/asset_orchestrator.h"
#include "../services/asset_query_service.h"
#include "../services/asset_service.h"
#include "../services/contract_service.h"

// Handlers
#include "../handlers/asset_handler.h"
#include "../handlers/contract_handler.h"

#include <spdlog/spdlog.h>

namespace infrastructure {

struct ServiceContainer::Impl {
    // Connection pool
    std::unique_ptr<common::DbConnectionPool> dbPool;
    std::unique_ptr<common::IQueryExecutor> queryExecutor;

    // Repositories
    std::unique_ptr<repositories::AssetRepository> assetRepository;
    std::unique_ptr<repositories::CertificateRepository> certificateRepository;
    std::unique_ptr<repositories::OwnershipTrailRepository> ownershipTrailRepository;
    std::unique_ptr<repositories::ContractRepository> contractRepository;

    // Services
    std::unique_ptr<services::CertificateIssuer> certificateIssuer;
    std::unique_ptr<services::AssetRegistry> assetRegistry;
    std::unique_ptr<services::AssetOrchestrator> assetOrchestrator;
    std::unique_ptr<services::AssetQueryService> assetQueryService;
    std::unique_ptr<services::AssetService> assetService;
    std::unique_ptr<services::ContractService> contractService;

    // Handlers
    std::unique_ptr<handlers::AssetHandler> assetHandler;
    std::unique_ptr<handlers::ContractHandler> contractHandler;
};

ServiceContainer::ServiceContainer() : impl_(std::make_unique<Impl>()) {}

ServiceContainer::~ServiceContainer() {
    shutdown();
}

void ServiceContainer::shutdown() {
    if (!impl_) return;

    // Release in reverse order
    impl_->contractHandler.reset();
    impl_->assetHandler.reset();

    impl_->contractService.reset();
    impl_->assetService.reset();
    impl_->assetQueryService.reset();
    impl_->assetOrchestrator.reset();
    impl_->assetRegistry.reset();
    impl_->certificateIssuer.reset();

    impl_->contractRepository.reset();
    impl_->ownershipTrailRepository.reset();
    impl_->certificateRepository.reset();
    impl_->assetRepository.reset();

    impl_->queryExecutor.reset();
    if (impl_->dbPool) {
        impl_->dbPool->shutdown();
        impl_->dbPool.reset();
        spdlog::info("Database connection pool closed");
    }

    spdlog::info("ServiceContainer resources released");
}

bool ServiceContainer::initialize(const AppConfig& config) {
    spdlog::info("ServiceContainer initializing...");

    // --- Phase 1-2: Database Connection Pool + Query Executor ---
    try {
        common::DbPoolConfig poolConfig;
        poolConfig.host = config.dbHost;
        poolConfig.port = config.dbPort;
        poolConfig.dbName = config.dbName;
        poolConfig.user = config.dbUser;
        poolConfig.password = config.dbPassword;
        poolConfig.minSize = static_cast<size_t>(config.dbPoolMin);
        poolConfig.maxSize = static_cast<size_t>(config.dbPoolMax);
        poolConfig.acquireTimeoutSec = config.dbPoolTimeoutSec;

        impl_->dbPool = std::make_unique<common::DbConnectionPool>(poolConfig);

        if (!impl_->dbPool->initialize()) {
            spdlog::critical("Failed to initialize database connection pool");
            return false;
        }
        spdlog::info("Database connection pool initialized (min={}, max={}, host={}:{}/{})",
                     config.dbPoolMin, config.dbPoolMax, config.dbHost, config.dbPort, config.dbName);

        impl_->queryExecutor = std::make_unique<common::PostgreSQLQueryExecutor>(impl_->dbPool.get());
        spdlog::info("Query Executor initialized (DB type: {})", impl_->queryExecutor->getDatabaseType());
    } catch (const std::exception& e) {
        spdlog::critical("Failed to initialize database connection pool: {}", e.what());
        return false;
    }

    try {
        // --- Phase 3: Repositories ---
        common::IQueryExecutor* executor = impl_->queryExecutor.get();
        impl_->assetRepository = std::make_unique<repositories::AssetRepository>(executor);
        impl_->certificateRepository = std::make_unique<repositories::CertificateRepository>(executor);
        impl_->ownershipTrailRepository = std::make_unique<repositories::OwnershipTrailRepository>(executor);
        impl_->contractRepository = std::make_unique<repositories::ContractRepository>(executor);
        spdlog::info("Repositories initialized (Asset, Certificate, OwnershipTrail, Contract)");

        // --- Phase 4: Certificate Issuer ---
        impl_->certificateIssuer = std::make_unique<services::CertificateIssuer>();

        // --- Phase 5: Services ---
        impl_->assetRegistry = std::make_unique<services::AssetRegistry>(impl_->assetRepository.get());
        impl_->assetOrchestrator = std::make_unique<services::AssetOrchestrator>(
            executor,
            impl_->assetRegistry.get(),
            impl_->certificateIssuer.get(),
            impl_->certificateRepository.get(),
            impl_->ownershipTrailRepository.get(),
            impl_->contractRepository.get());
        impl_->assetQueryService = std::make_unique<services::AssetQueryService>(
            impl_->assetRepository.get(), config.streamMaxOffset);
        impl_->assetService = std::make_unique<services::AssetService>(
            impl_->assetRegistry.get(),
            impl_->assetOrchestrator.get(),
            impl_->assetQueryService.get(),
            impl_->certificateRepository.get(),
            impl_->ownershipTrailRepository.get());
        impl_->contractService = std::make_unique<services::ContractService>(
            impl_->contractRepository.get(), impl_->assetRegistry.get());
        spdlog::info("Services initialized (stream offset ceiling {})", config.streamMaxOffset);

        // --- Phase 6: Handlers ---
        impl_->assetHandler = std::make_unique<handlers::AssetHandler>(
            impl_->assetService.get());
        impl_->contractHandler = std::make_unique<handlers::ContractHandler>(
            impl_->contractService.get());
    } catch (const std::exception& e) {
        spdlog::critical("Failed to initialize services: {}", e.what());
        return false;
    }

    spdlog::info("ServiceContainer initialization complete");
    return true;
}

// --- Infrastructure Accessors ---
common::DbConnectionPool* ServiceContainer::dbPool() const { return impl_->dbPool.get(); }
common::IQueryExecutor* ServiceContainer::queryExecutor() const { return impl_->queryExecutor.get(); }

// --- Repository Accessors ---
repositories::IAssetRepository* ServiceContainer::assetRepository() const { return impl_->assetRepository.get(); }
repositories::ICertificateRepository* ServiceContainer::certificateRepository() const { return impl_->certificateRepository.get(); }
repositories::IOwnershipTrailRepository* ServiceContainer::ownershipTrailRepository() const { return impl_->ownershipTrailRepository.get(); }
repositories::IContractRepository* ServiceContainer::contractRepository() const { return impl_->contractRepository.get(); }

// --- Service Accessors ---
services::CertificateIssuer* ServiceContainer::certificateIssuer() const { return impl_->certificateIssuer.get(); }
services::AssetService* ServiceContainer::assetService() const { return impl_->assetService.get(); }
services::ContractService* ServiceContainer::contractService() const { return impl_->contractService.get(); }

// --- Handler Accessors ---
handlers::AssetHandler* ServiceContainer::assetHandler() const { return impl_->assetHandler.get(); }
handlers::ContractHandler* ServiceContainer::contractHandler() const { return impl_->contractHandler.get(); }

} // namespace infrastructure
