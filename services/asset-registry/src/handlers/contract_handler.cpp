/** @file contract_handler.cpp
 *  @brief ContractHandler implementation
 */

#include "contract_handler.h"
#include "handler_utils.h"
#include <spdlog/spdlog.h>

using namespace drogon;

namespace handlers {

ContractHandler::ContractHandler(services::ContractService* service)
    : service_(service) {
    spdlog::info("[ContractHandler] Initialized");
}

ContractHandler::~ContractHandler() {}

void ContractHandler::registerRoutes(HttpAppFramework& app) {
    app.registerHandler(
        "/api/contracts",
        [this](const HttpRequestPtr& req,
               std::function<void(const HttpResponsePtr&)>&& callback) {
            this->handleCreate(req, std::move(callback));
        },
        {Post});

    app.registerHandler(
        "/api/contracts/{assetId}",
        [this](const HttpRequestPtr& req,
               std::function<void(const HttpResponsePtr&)>&& callback,
               const std::string& assetId) {
            this->handleFind(req, std::move(callback), assetId);
        },
        {Get});

    spdlog::info("[ContractHandler] Routes registered: POST /api/contracts, GET /api/contracts/{{assetId}}");
}

void ContractHandler::handleCreate(
    const HttpRequestPtr& req,
    std::function<void(const HttpResponsePtr&)>&& callback) {

    std::string requestId = common::handler::requestId(req);
    try {
        const Json::Value& body = common::handler::requireJsonBody(req);

        domain::models::NewContractInput input;
        input.userFingerprint = common::handler::requireFingerprint(req);
        input.assetId = common::handler::requireString(body, "assetId");
        input.summary = common::handler::optionalString(body, "summary").value_or("");
        input.content = common::handler::optionalString(body, "content").value_or("");
        input.organization = common::handler::optionalString(body, "organization").value_or("");

        spdlog::info("[ContractHandler] {} POST /api/contracts asset={}", requestId, input.assetId);
        auto contract = service_->createContract(input);

        Json::Value response;
        response["success"] = true;
        response["contract"] = modelToJson(contract);
        auto resp = HttpResponse::newHttpJsonResponse(response);
        resp->setStatusCode(k201Created);
        callback(common::handler::withRequestId(resp, requestId));

    } catch (const std::exception& e) {
        callback(common::handler::withRequestId(
            common::handler::errorResponse("ContractHandler", e), requestId));
    }
}

void ContractHandler::handleFind(
    const HttpRequestPtr& req,
    std::function<void(const HttpResponsePtr&)>&& callback,
    const std::string& assetId) {

    std::string requestId = common::handler::requestId(req);
    try {
        Json::Value response;
        response["success"] = true;
        response["contract"] = modelToJson(service_->findContract(assetId));
        auto resp = HttpResponse::newHttpJsonResponse(response);
        callback(common::handler::withRequestId(resp, requestId));

    } catch (const std::exception& e) {
        callback(common::handler::withRequestId(
            common::handler::errorResponse("ContractHandler", e), requestId));
    }
}

Json::Value ContractHandler::modelToJson(const domain::models::Contract& contract) {
    Json::Value json;
    json["id"] = contract.id;
    json["assetId"] = contract.assetId;
    json["summary"] = contract.summary;
    json["content"] = contract.content;
    json["organization"] = contract.organization;
    json["updatedBy"] = contract.updatedBy;
    json["updateCount"] = contract.updateCount;
    json["createdAt"] = contract.createdAt;
    json["updatedAt"] = contract.updatedAt;
    return json;
}

} // namespace handlers
