#pragma once

/**
 * @file asset_handler.h
 * @brief HTTP handler for asset, certificate and trail endpoints
 *
 * Callers identify themselves with the X-User-Fingerprint header.
 * GET /api/assets/stream answers with newline-delimited JSON, read
 * from storage only as fast as the client consumes it.
 */

#include <drogon/drogon.h>
#include "../services/asset_service.h"
#include "../services/ndjson_stream.h"

namespace handlers {

class AssetHandler {
public:
    explicit AssetHandler(services::AssetService* service);

    void registerRoutes(drogon::HttpAppFramework& app);

private:
    services::AssetService* service_;

    /** POST /api/assets */
    void handleCreate(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback);

    /** GET /api/assets?offset=&limit=&order=&sort= */
    void handleGetPage(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback);

    /** GET /api/assets/stream?offset=&limit=&order=&sort= */
    void handleStream(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback);

    /** GET /api/assets/search?field=&term=&offset=&limit=&order= */
    void handleSearch(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback);

    /** GET /api/assets/{id} */
    void handleGetById(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback,
        const std::string& id);

    /** PUT /api/assets/{id} */
    void handleUpdate(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback,
        const std::string& id);

    /** DELETE /api/assets/{id}?organization= */
    void handleDelete(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback,
        const std::string& id);

    /** POST /api/assets/{id}/transfer */
    void handleTransfer(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback,
        const std::string& id);

    /** GET /api/assets/{id}/certificate */
    void handleGetCertificate(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback,
        const std::string& id);

    /** GET /api/certificates/{id}/trail */
    void handleGetTrail(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback,
        const std::string& certificateId);

    static Json::Value assetToJson(const domain::models::Asset& asset);
    static Json::Value pageToJson(const services::AssetPage& page);
    static Json::Value batchToJson(const services::AssetBatch& batch);
};

} // namespace handlers
