/**
 * @file main.cpp
 * @brief Asset Registry Service
 *
 * REST API for registering digital assets, issuing their certificates,
 * transferring ownership and streaming the asset catalogue.
 */

#include <drogon/drogon.h>
#include <spdlog/spdlog.h>

#include <iostream>

#include "logger.h"
#include "db_connection_pool.h"
#include "infrastructure/app_config.h"
#include "infrastructure/service_container.h"
#include "handlers/asset_handler.h"
#include "handlers/contract_handler.h"

namespace {

void printBanner() {
    std::cout << std::endl;
    std::cout << "  Asset Registry Service" << std::endl;
    std::cout << "  Assets, certificates and ownership transfers" << std::endl;
    std::cout << "  Version: 1.0.0" << std::endl;
    std::cout << std::endl;
}

} // namespace

int main(int /* argc */, char* /* argv */[]) {
    printBanner();

    AppConfig config = AppConfig::fromEnvironment();
    common::Logger::initialize("asset-registry", config.logLevel,
                               !config.logFile.empty(), config.logFile);

    try {
        config.validateRequiredCredentials();
    } catch (const std::exception& e) {
        spdlog::critical("{}", e.what());
        return 1;
    }

    spdlog::info("Starting Asset Registry Service (env={})...", config.environment);
    spdlog::info("Database: {}:{}/{}", config.dbHost, config.dbPort, config.dbName);

    infrastructure::ServiceContainer container;
    if (!container.initialize(config)) {
        spdlog::critical("Service initialization failed");
        return 1;
    }

    auto poolStats = container.dbPool()->getStats();
    spdlog::info("Database pool ready: {} idle of {} open (max {})",
                 poolStats.availableConnections, poolStats.totalConnections,
                 poolStats.maxConnections);

    try {
        auto& app = drogon::app();

        app.addListener("0.0.0.0", config.serverPort)
           .setThreadNum(config.threadNum)
           .enableGzip(true)
           .setClientMaxBodySize(1 * 1024 * 1024);

        app.registerPreSendingAdvice([](const drogon::HttpRequestPtr& /* req */,
                                        const drogon::HttpResponsePtr& resp) {
            resp->addHeader("Access-Control-Allow-Origin", "*");
            resp->addHeader("Access-Control-Allow-Methods", "GET, POST, PUT, DELETE, OPTIONS");
            resp->addHeader("Access-Control-Allow-Headers",
                            "Content-Type, X-User-Fingerprint, X-Request-Id");
        });

        container.assetHandler()->registerRoutes(app);
        container.contractHandler()->registerRoutes(app);

        spdlog::info("Server starting on http://0.0.0.0:{} ({} threads)",
                     config.serverPort, config.threadNum);
        app.run();

    } catch (const std::exception& e) {
        spdlog::error("Application error: {}", e.what());
        return 1;
    }

    spdlog::info("Server stopped");
    common::Logger::flush();
    return 0;
}
