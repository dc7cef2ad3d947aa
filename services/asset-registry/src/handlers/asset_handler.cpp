/** @file asset_handler.cpp
 *  @brief AssetHandler implementation
 */

#include "asset_handler.h"
#include "handler_utils.h"
#include "exceptions.h"
#include "registry/utils/string_utils.h"
#include <spdlog/spdlog.h>

using namespace drogon;

namespace handlers {

namespace {

domain::models::OrderType orderParam(const HttpRequestPtr& req) {
    std::string value = req->getParameter("order");
    if (value.empty()) return domain::models::OrderType::Ascending;
    return domain::models::parseOrderType(value);
}

domain::models::AssetSortField sortParam(const HttpRequestPtr& req) {
    std::string value = req->getParameter("sort");
    if (value.empty()) return domain::models::AssetSortField::Name;
    return domain::models::parseSortField(value);
}

repositories::AssetSearchField searchFieldParam(const HttpRequestPtr& req) {
    std::string value = registry::utils::toLower(registry::utils::trim(req->getParameter("field")));
    if (value.empty() || value == "name") return repositories::AssetSearchField::Name;
    if (value == "symbol") return repositories::AssetSearchField::Symbol;
    throw common::ValidationException("field must be 'name' or 'symbol'");
}

} // namespace

AssetHandler::AssetHandler(services::AssetService* service)
    : service_(service) {
    spdlog::info("[AssetHandler] Initialized");
}

void AssetHandler::registerRoutes(HttpAppFramework& app) {
    spdlog::info("[AssetHandler] Registering asset API routes");

    // Fixed paths first so they are not captured by /api/assets/{id}
    app.registerHandler(
        "/api/assets/stream",
        [this](const HttpRequestPtr& req,
               std::function<void(const HttpResponsePtr&)>&& callback) {
            this->handleStream(req, std::move(callback));
        },
        {Get});

    app.registerHandler(
        "/api/assets/search",
        [this](const HttpRequestPtr& req,
               std::function<void(const HttpResponsePtr&)>&& callback) {
            this->handleSearch(req, std::move(callback));
        },
        {Get});

    app.registerHandler(
        "/api/assets",
        [this](const HttpRequestPtr& req,
               std::function<void(const HttpResponsePtr&)>&& callback) {
            this->handleGetPage(req, std::move(callback));
        },
        {Get});

    app.registerHandler(
        "/api/assets",
        [this](const HttpRequestPtr& req,
               std::function<void(const HttpResponsePtr&)>&& callback) {
            this->handleCreate(req, std::move(callback));
        },
        {Post});

    app.registerHandler(
        "/api/assets/{id}/transfer",
        [this](const HttpRequestPtr& req,
               std::function<void(const HttpResponsePtr&)>&& callback,
               const std::string& id) {
            this->handleTransfer(req, std::move(callback), id);
        },
        {Post});

    app.registerHandler(
        "/api/assets/{id}/certificate",
        [this](const HttpRequestPtr& req,
               std::function<void(const HttpResponsePtr&)>&& callback,
               const std::string& id) {
            this->handleGetCertificate(req, std::move(callback), id);
        },
        {Get});

    app.registerHandler(
        "/api/assets/{id}",
        [this](const HttpRequestPtr& req,
               std::function<void(const HttpResponsePtr&)>&& callback,
               const std::string& id) {
            this->handleGetById(req, std::move(callback), id);
        },
        {Get});

    app.registerHandler(
        "/api/assets/{id}",
        [this](const HttpRequestPtr& req,
               std::function<void(const HttpResponsePtr&)>&& callback,
               const std::string& id) {
            this->handleUpdate(req, std::move(callback), id);
        },
        {Put});

    app.registerHandler(
        "/api/assets/{id}",
        [this](const HttpRequestPtr& req,
               std::function<void(const HttpResponsePtr&)>&& callback,
               const std::string& id) {
            this->handleDelete(req, std::move(callback), id);
        },
        {Delete});

    app.registerHandler(
        "/api/certificates/{id}/trail",
        [this](const HttpRequestPtr& req,
               std::function<void(const HttpResponsePtr&)>&& callback,
               const std::string& id) {
            this->handleGetTrail(req, std::move(callback), id);
        },
        {Get});

    spdlog::info("[AssetHandler] Routes registered: GET/POST /api/assets, GET /api/assets/stream, "
                 "GET /api/assets/search, GET/PUT/DELETE /api/assets/{{id}}, "
                 "POST /api/assets/{{id}}/transfer, GET /api/assets/{{id}}/certificate, "
                 "GET /api/certificates/{{id}}/trail");
}

void AssetHandler::handleCreate(
    const HttpRequestPtr& req,
    std::function<void(const HttpResponsePtr&)>&& callback) {

    std::string requestId = common::handler::requestId(req);
    try {
        const Json::Value& body = common::handler::requireJsonBody(req);

        domain::models::NewAssetInput input;
        input.ownerFingerprint = common::handler::requireFingerprint(req);
        input.name = common::handler::optionalString(body, "name").value_or("");
        input.symbol = common::handler::optionalString(body, "symbol").value_or("");
        input.description = common::handler::optionalString(body, "description").value_or("");
        input.organization = common::handler::optionalString(body, "organization").value_or("");

        spdlog::info("[AssetHandler] {} POST /api/assets (organization={})", requestId, input.organization);
        std::string assetId = service_->createAsset(input);

        Json::Value response;
        response["success"] = true;
        response["assetId"] = assetId;
        auto resp = HttpResponse::newHttpJsonResponse(response);
        resp->setStatusCode(k201Created);
        callback(common::handler::withRequestId(resp, requestId));

    } catch (const std::exception& e) {
        callback(common::handler::withRequestId(
            common::handler::errorResponse("AssetHandler", e), requestId));
    }
}

void AssetHandler::handleGetPage(
    const HttpRequestPtr& req,
    std::function<void(const HttpResponsePtr&)>&& callback) {

    std::string requestId = common::handler::requestId(req);
    try {
        int64_t offset = common::handler::parseInt64Param("offset", req->getParameter("offset"), 0);
        int64_t limit = common::handler::parseInt64Param("limit", req->getParameter("limit"), 0);
        if (offset == 0 && limit == 0) {
            throw common::ValidationException("offset and limit cannot both be zero");
        }

        auto page = service_->getPaginatedAssets(offset, limit, orderParam(req), sortParam(req));
        auto resp = HttpResponse::newHttpJsonResponse(pageToJson(page));
        callback(common::handler::withRequestId(resp, requestId));

    } catch (const std::exception& e) {
        callback(common::handler::withRequestId(
            common::handler::errorResponse("AssetHandler", e), requestId));
    }
}

void AssetHandler::handleStream(
    const HttpRequestPtr& req,
    std::function<void(const HttpResponsePtr&)>&& callback) {

    std::string requestId = common::handler::requestId(req);
    std::shared_ptr<services::NdjsonStream> lines;
    try {
        int64_t offset = common::handler::parseInt64Param("offset", req->getParameter("offset"), 0);
        int64_t limit = common::handler::parseInt64Param("limit", req->getParameter("limit"), 0);
        if (offset == 0 && limit == 0) {
            throw common::ValidationException("offset and limit cannot both be zero");
        }
        lines = std::make_shared<services::NdjsonStream>(
            service_->getStreamedAssets(offset, limit, orderParam(req), sortParam(req)),
            &AssetHandler::batchToJson,
            [](const std::exception& e) { return common::handler::errorBody("AssetHandler", e); });
        spdlog::info("[AssetHandler] {} GET /api/assets/stream offset={} limit={}",
                     requestId, offset, limit);
    } catch (const std::exception& e) {
        callback(common::handler::withRequestId(
            common::handler::errorResponse("AssetHandler", e), requestId));
        return;
    }

    // Pulled by drogon as the socket drains; one item per storage step
    auto resp = HttpResponse::newStreamResponse(
        [lines, requestId](char* buffer, std::size_t size) -> std::size_t {
            std::size_t n = lines->read(buffer, size);
            if (n == 0) {
                if (buffer) {
                    spdlog::debug("[AssetHandler] {} stream finished after {} item(s)",
                                  requestId, lines->itemsWritten());
                } else {
                    spdlog::info("[AssetHandler] {} stream closed after {} item(s)",
                                 requestId, lines->itemsWritten());
                }
            }
            return n;
        },
        "", CT_CUSTOM, "application/x-ndjson; charset=utf-8");

    resp->addHeader("Cache-Control", "no-cache");
    callback(common::handler::withRequestId(resp, requestId));
}

void AssetHandler::handleSearch(
    const HttpRequestPtr& req,
    std::function<void(const HttpResponsePtr&)>&& callback) {

    std::string requestId = common::handler::requestId(req);
    try {
        int64_t offset = common::handler::parseInt64Param("offset", req->getParameter("offset"), 0);
        int64_t limit = common::handler::parseInt64Param("limit", req->getParameter("limit"), 20);

        auto page = service_->searchAssets(searchFieldParam(req), req->getParameter("term"),
                                           offset, limit, orderParam(req));
        auto resp = HttpResponse::newHttpJsonResponse(pageToJson(page));
        callback(common::handler::withRequestId(resp, requestId));

    } catch (const std::exception& e) {
        callback(common::handler::withRequestId(
            common::handler::errorResponse("AssetHandler", e), requestId));
    }
}

void AssetHandler::handleGetById(
    const HttpRequestPtr& req,
    std::function<void(const HttpResponsePtr&)>&& callback,
    const std::string& id) {

    std::string requestId = common::handler::requestId(req);
    try {
        Json::Value response;
        response["success"] = true;
        response["asset"] = assetToJson(service_->getAssetById(id));
        auto resp = HttpResponse::newHttpJsonResponse(response);
        callback(common::handler::withRequestId(resp, requestId));

    } catch (const std::exception& e) {
        callback(common::handler::withRequestId(
            common::handler::errorResponse("AssetHandler", e), requestId));
    }
}

void AssetHandler::handleUpdate(
    const HttpRequestPtr& req,
    std::function<void(const HttpResponsePtr&)>&& callback,
    const std::string& id) {

    std::string requestId = common::handler::requestId(req);
    try {
        const Json::Value& body = common::handler::requireJsonBody(req);
        std::string updatedBy = common::handler::requireFingerprint(req);
        std::string organization = common::handler::requireString(body, "organization");

        domain::models::AssetUpdate fields;
        fields.name = common::handler::optionalString(body, "name");
        fields.symbol = common::handler::optionalString(body, "symbol");
        fields.description = common::handler::optionalString(body, "description");
        fields.listable = common::handler::optionalBool(body, "listable");
        fields.tradable = common::handler::optionalBool(body, "tradable");

        spdlog::info("[AssetHandler] {} PUT /api/assets/{} by {}", requestId, id, updatedBy);
        bool updated = service_->updateAsset(id, organization, updatedBy, fields);

        Json::Value response;
        response["success"] = true;
        response["updated"] = updated;
        auto resp = HttpResponse::newHttpJsonResponse(response);
        callback(common::handler::withRequestId(resp, requestId));

    } catch (const std::exception& e) {
        callback(common::handler::withRequestId(
            common::handler::errorResponse("AssetHandler", e), requestId));
    }
}

void AssetHandler::handleDelete(
    const HttpRequestPtr& req,
    std::function<void(const HttpResponsePtr&)>&& callback,
    const std::string& id) {

    std::string requestId = common::handler::requestId(req);
    try {
        std::string organization = req->getParameter("organization");
        if (organization.empty()) {
            throw common::ValidationException("organization is required");
        }

        spdlog::info("[AssetHandler] {} DELETE /api/assets/{}", requestId, id);
        bool deleted = service_->deleteAsset(id, organization);

        Json::Value response;
        response["success"] = true;
        response["deleted"] = deleted;
        auto resp = HttpResponse::newHttpJsonResponse(response);
        callback(common::handler::withRequestId(resp, requestId));

    } catch (const std::exception& e) {
        callback(common::handler::withRequestId(
            common::handler::errorResponse("AssetHandler", e), requestId));
    }
}

void AssetHandler::handleTransfer(
    const HttpRequestPtr& req,
    std::function<void(const HttpResponsePtr&)>&& callback,
    const std::string& id) {

    std::string requestId = common::handler::requestId(req);
    try {
        const Json::Value& body = common::handler::requireJsonBody(req);

        services::TransferRequest request;
        request.assetId = id;
        request.organization = common::handler::requireString(body, "organization");
        request.newOrganization = common::handler::requireString(body, "newOrganization");
        request.newOwnerFingerprint = common::handler::requireString(body, "newOwner");

        spdlog::info("[AssetHandler] {} POST /api/assets/{}/transfer to {}",
                     requestId, id, request.newOrganization);
        std::string certificateId = service_->transferAsset(request);

        Json::Value response;
        response["success"] = true;
        response["certificateId"] = certificateId;
        auto resp = HttpResponse::newHttpJsonResponse(response);
        callback(common::handler::withRequestId(resp, requestId));

    } catch (const std::exception& e) {
        callback(common::handler::withRequestId(
            common::handler::errorResponse("AssetHandler", e), requestId));
    }
}

void AssetHandler::handleGetCertificate(
    const HttpRequestPtr& req,
    std::function<void(const HttpResponsePtr&)>&& callback,
    const std::string& id) {

    std::string requestId = common::handler::requestId(req);
    try {
        auto cert = service_->findCertificateByAsset(id);

        Json::Value certJson;
        certJson["id"] = cert.id;
        certJson["assetId"] = cert.assetId;
        certJson["payload"] = cert.payload;
        certJson["createdAt"] = cert.createdAt;

        Json::Value response;
        response["success"] = true;
        response["certificate"] = certJson;
        auto resp = HttpResponse::newHttpJsonResponse(response);
        callback(common::handler::withRequestId(resp, requestId));

    } catch (const std::exception& e) {
        callback(common::handler::withRequestId(
            common::handler::errorResponse("AssetHandler", e), requestId));
    }
}

void AssetHandler::handleGetTrail(
    const HttpRequestPtr& req,
    std::function<void(const HttpResponsePtr&)>&& callback,
    const std::string& certificateId) {

    std::string requestId = common::handler::requestId(req);
    try {
        auto entries = service_->getCertificateTrail(certificateId);

        Json::Value trail(Json::arrayValue);
        for (const auto& entry : entries) {
            Json::Value item;
            item["certificateId"] = entry.certificateId;
            item["assetId"] = entry.assetId;
            item["newOwner"] = entry.newOwnerFingerprint;
            item["transferredOn"] = entry.transferredOn;
            trail.append(item);
        }

        Json::Value response;
        response["success"] = true;
        response["count"] = static_cast<Json::UInt64>(entries.size());
        response["trail"] = trail;
        auto resp = HttpResponse::newHttpJsonResponse(response);
        callback(common::handler::withRequestId(resp, requestId));

    } catch (const std::exception& e) {
        callback(common::handler::withRequestId(
            common::handler::errorResponse("AssetHandler", e), requestId));
    }
}

Json::Value AssetHandler::assetToJson(const domain::models::Asset& asset) {
    Json::Value json;
    json["id"] = asset.id;
    json["name"] = asset.name;
    json["symbol"] = asset.symbol;
    json["description"] = asset.description;
    json["organization"] = asset.organization;
    json["owner"] = asset.ownerFingerprint;
    json["listable"] = asset.listable;
    json["tradable"] = asset.tradable;
    json["createdAt"] = asset.createdAt;
    json["updatedAt"] = asset.updatedAt;
    json["updatedBy"] = asset.updatedBy ? Json::Value(*asset.updatedBy) : Json::Value();
    return json;
}

Json::Value AssetHandler::pageToJson(const services::AssetPage& page) {
    Json::Value json;
    json["success"] = true;
    json["offset"] = static_cast<Json::Int64>(page.offset);
    json["total"] = static_cast<Json::Int64>(page.total);
    Json::Value assets(Json::arrayValue);
    for (const auto& asset : page.assets) {
        assets.append(assetToJson(asset));
    }
    json["assets"] = assets;
    return json;
}

Json::Value AssetHandler::batchToJson(const services::AssetBatch& batch) {
    Json::Value json;
    json["offset"] = static_cast<Json::Int64>(batch.offset);
    json["total"] = static_cast<Json::Int64>(batch.total());
    Json::Value assets(Json::arrayValue);
    for (const auto& asset : batch.assets) {
        assets.append(assetToJson(asset));
    }
    json["assets"] = assets;
    return json;
}

} // namespace handlers
