#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <json/json.h>

/**
 * @file query_helpers.h
 * @brief Row extraction and SQL fragment helpers shared by repositories
 *
 * Usage:
 *   sql << "SELECT " << common::db::utcTimestamp("created_at") << " ...";
 *   sql << common::db::paginationClause(limit, offset);
 *   params.push_back(common::db::containsPattern(term));
 */

namespace common::db {

// ============================================================================
// JSON row extraction
// ============================================================================

/**
 * @brief String column, or defaultValue when missing or NULL
 */
std::string getString(const Json::Value& row, const std::string& field,
                      const std::string& defaultValue = "");

/**
 * @brief Nullable string column
 */
std::optional<std::string> getOptionalString(const Json::Value& row, const std::string& field);

/**
 * @brief Integer column; accepts native numbers and numeric strings
 */
int64_t getInt64(const Json::Value& row, const std::string& field, int64_t defaultValue = 0);

int getInt(const Json::Value& row, const std::string& field, int defaultValue = 0);

/**
 * @brief Boolean column; accepts native bools and "t"/"true"/"1"
 */
bool getBool(const Json::Value& row, const std::string& field, bool defaultValue = false);

/**
 * @brief Convert an executeScalar() result to an integer
 */
int64_t scalarToInt64(const Json::Value& value, int64_t defaultValue = 0);

// ============================================================================
// SQL fragments and parameters
// ============================================================================

/**
 * @brief Bind value for a boolean parameter
 */
inline std::string boolParam(bool value) {
    return value ? "true" : "false";
}

/**
 * @brief Escape LIKE/ILIKE wildcards so the term matches literally
 *
 * Escapes '\', '%' and '_' with a backslash. Use with ESCAPE '\'.
 */
std::string escapeLikePattern(const std::string& term);

/**
 * @brief "%<escaped term>%" for substring matching
 */
std::string containsPattern(const std::string& term);

/**
 * @return " LIMIT <limit> OFFSET <offset>"
 */
std::string paginationClause(int64_t limit, int64_t offset);

/**
 * @brief ISO-8601 UTC rendering of a timestamptz column, aliased to its own name
 *
 * utcTimestamp("created_at") ->
 *   to_char(created_at AT TIME ZONE 'UTC', 'YYYY-MM-DD"T"HH24:MI:SS.US"Z"') AS created_at
 */
std::string utcTimestamp(const std::string& column);

} // namespace common::db
