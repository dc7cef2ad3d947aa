/**
 * @file query_helpers.cpp
 * @brief Row extraction and SQL fragment helpers
 */

#include "query_helpers.h"
#include <sstream>
#include <stdexcept>

namespace common::db {

namespace {

bool present(const Json::Value& row, const std::string& field) {
    return row.isObject() && row.isMember(field) && !row[field].isNull();
}

int64_t toInt64(const Json::Value& v, int64_t defaultValue) {
    if (v.isInt64()) return v.asInt64();
    if (v.isUInt64()) return static_cast<int64_t>(v.asUInt64());
    if (v.isDouble()) return static_cast<int64_t>(v.asDouble());
    if (v.isString()) {
        const auto& s = v.asString();
        if (s.empty()) return defaultValue;
        try { return std::stoll(s); }
        catch (const std::exception&) { return defaultValue; }
    }
    return defaultValue;
}

} // anonymous namespace

// ============================================================================
// JSON row extraction
// ============================================================================

std::string getString(const Json::Value& row, const std::string& field,
                      const std::string& defaultValue) {
    if (!present(row, field)) return defaultValue;
    return row[field].asString();
}

std::optional<std::string> getOptionalString(const Json::Value& row, const std::string& field) {
    if (!present(row, field)) return std::nullopt;
    return row[field].asString();
}

int64_t getInt64(const Json::Value& row, const std::string& field, int64_t defaultValue) {
    if (!present(row, field)) return defaultValue;
    return toInt64(row[field], defaultValue);
}

int getInt(const Json::Value& row, const std::string& field, int defaultValue) {
    return static_cast<int>(getInt64(row, field, defaultValue));
}

bool getBool(const Json::Value& row, const std::string& field, bool defaultValue) {
    if (!present(row, field)) return defaultValue;
    const auto& v = row[field];
    if (v.isBool()) return v.asBool();
    if (v.isString()) {
        const auto& s = v.asString();
        return s == "1" || s == "true" || s == "TRUE" || s == "t" || s == "T";
    }
    if (v.isIntegral()) return v.asInt64() != 0;
    return defaultValue;
}

int64_t scalarToInt64(const Json::Value& value, int64_t defaultValue) {
    if (value.isNull()) return defaultValue;
    return toInt64(value, defaultValue);
}

// ============================================================================
// SQL fragments
// ============================================================================

std::string escapeLikePattern(const std::string& term) {
    std::string out;
    out.reserve(term.size() + 4);
    for (char c : term) {
        if (c == '\\' || c == '%' || c == '_') {
            out += '\\';
        }
        out += c;
    }
    return out;
}

std::string containsPattern(const std::string& term) {
    return "%" + escapeLikePattern(term) + "%";
}

std::string paginationClause(int64_t limit, int64_t offset) {
    std::ostringstream ss;
    ss << " LIMIT " << limit << " OFFSET " << offset;
    return ss.str();
}

std::string utcTimestamp(const std::string& column) {
    return "to_char(" + column + " AT TIME ZONE 'UTC', "
           "'YYYY-MM-DD\"T\"HH24:MI:SS.US\"Z\"') AS " + column;
}

} // namespace common::db
