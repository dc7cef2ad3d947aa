#pragma once

/**
 * @file contract_handler.h
 * @brief HTTP handler for contract endpoints
 */

#include <drogon/drogon.h>
#include "../services/contract_service.h"

namespace handlers {

class ContractHandler {
public:
    explicit ContractHandler(services::ContractService* service);
    ~ContractHandler();

    void registerRoutes(drogon::HttpAppFramework& app);

private:
    services::ContractService* service_;

    /** POST /api/contracts */
    void handleCreate(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback);

    /** GET /api/contracts/{assetId} */
    void handleFind(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback,
        const std::string& assetId);

    Json::Value modelToJson(const domain::models::Contract& contract);
};

} // namespace handlers
