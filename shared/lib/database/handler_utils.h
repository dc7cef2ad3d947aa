#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <json/json.h>
#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>
#include <spdlog/spdlog.h>
#include "exceptions.h"
#include "UuidUtil.hpp"

/**
 * @file handler_utils.h
 * @brief Request parsing and error responses shared by HTTP handlers
 *
 * Error responses never expose internal exception text: only
 * Validation, NotFound, Conflict and StorageUnavailable messages reach
 * the client, everything else becomes a generic 500.
 */

namespace common::handler {

inline constexpr const char* REQUEST_ID_HEADER = "X-Request-Id";
inline constexpr const char* FINGERPRINT_HEADER = "X-User-Fingerprint";

inline drogon::HttpStatusCode statusFor(ErrorCode code) {
    switch (code) {
        case ErrorCode::Validation:         return drogon::k400BadRequest;
        case ErrorCode::NotFound:           return drogon::k404NotFound;
        case ErrorCode::Conflict:           return drogon::k409Conflict;
        case ErrorCode::StorageUnavailable: return drogon::k503ServiceUnavailable;
        default:                            return drogon::k500InternalServerError;
    }
}

/**
 * Error object for a response body or a final stream item.
 * Logs the real error; client-facing text is sanitized for 500s.
 */
inline Json::Value errorBody(const std::string& logContext, const std::exception& e) {
    Json::Value error;
    auto* registryError = dynamic_cast<const RegistryException*>(&e);
    if (registryError && statusFor(registryError->code()) != drogon::k500InternalServerError) {
        spdlog::warn("[{}] {}", logContext, e.what());
        error["code"] = errorCodeName(registryError->code());
        error["message"] = e.what();
    } else {
        spdlog::error("[{}] {}", logContext, e.what());
        error["code"] = registryError ? errorCodeName(registryError->code()) : "INTERNAL_ERROR";
        error["message"] = "Internal server error";
    }
    return error;
}

inline drogon::HttpResponsePtr errorResponse(const std::string& logContext, const std::exception& e) {
    Json::Value body;
    body["success"] = false;
    body["error"] = errorBody(logContext, e);

    auto resp = drogon::HttpResponse::newHttpJsonResponse(body);
    auto* registryError = dynamic_cast<const RegistryException*>(&e);
    resp->setStatusCode(registryError ? statusFor(registryError->code())
                                      : drogon::k500InternalServerError);
    return resp;
}

/**
 * Request id from the X-Request-Id header, or a fresh UUID.
 */
inline std::string requestId(const drogon::HttpRequestPtr& req) {
    std::string id = req->getHeader(REQUEST_ID_HEADER);
    return id.empty() ? shared::util::UuidUtil::generate() : id;
}

inline const drogon::HttpResponsePtr& withRequestId(const drogon::HttpResponsePtr& resp,
                                                    const std::string& id) {
    resp->addHeader(REQUEST_ID_HEADER, id);
    return resp;
}

/**
 * Integer query parameter; defaultValue when absent.
 * @throws ValidationException if present but not an integer
 */
inline int64_t parseInt64Param(const std::string& name, const std::string& value,
                               int64_t defaultValue) {
    if (value.empty()) return defaultValue;
    try {
        size_t consumed = 0;
        long long parsed = std::stoll(value, &consumed);
        if (consumed != value.size()) {
            throw ValidationException(name + " must be an integer");
        }
        return static_cast<int64_t>(parsed);
    } catch (const std::invalid_argument&) {
        throw ValidationException(name + " must be an integer");
    } catch (const std::out_of_range&) {
        throw ValidationException(name + " is out of range");
    }
}

/**
 * @throws ValidationException if the body is missing or not a JSON object
 */
inline const Json::Value& requireJsonBody(const drogon::HttpRequestPtr& req) {
    auto json = req->getJsonObject();
    if (!json || !json->isObject()) {
        throw ValidationException("request body must be a JSON object");
    }
    return *json;
}

inline std::optional<std::string> optionalString(const Json::Value& body, const char* key) {
    if (!body.isMember(key) || body[key].isNull()) return std::nullopt;
    if (!body[key].isString()) {
        throw ValidationException(std::string(key) + " must be a string");
    }
    return body[key].asString();
}

inline std::string requireString(const Json::Value& body, const char* key) {
    auto value = optionalString(body, key);
    if (!value || value->empty()) {
        throw ValidationException(std::string(key) + " is required");
    }
    return *value;
}

inline std::optional<bool> optionalBool(const Json::Value& body, const char* key) {
    if (!body.isMember(key) || body[key].isNull()) return std::nullopt;
    if (!body[key].isBool()) {
        throw ValidationException(std::string(key) + " must be a boolean");
    }
    return body[key].asBool();
}

/**
 * @throws ValidationException if the X-User-Fingerprint header is missing
 */
inline std::string requireFingerprint(const drogon::HttpRequestPtr& req) {
    std::string fingerprint = req->getHeader(FINGERPRINT_HEADER);
    if (fingerprint.empty()) {
        throw ValidationException(std::string(FINGERPRINT_HEADER) + " header is required");
    }
    return fingerprint;
}

} // namespace common::handler
