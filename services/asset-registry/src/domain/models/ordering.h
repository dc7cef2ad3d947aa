#pragma once

/**
 * @file ordering.h
 * @brief Sort direction and sort key for asset listings
 */

#include <string>

namespace domain {
namespace models {

enum class OrderType {
    Ascending,
    Descending
};

/**
 * @brief Whitelisted columns an asset listing may be sorted by
 */
enum class AssetSortField {
    Name,
    Symbol,
    CreatedAt
};

/**
 * @brief Parse "asc"/"ascending"/"desc"/"descending", case-insensitively
 *
 * Surrounding whitespace is ignored.
 * @throws common::ValidationException for any other value
 */
OrderType parseOrderType(const std::string& value);

/**
 * @return "ASC" or "DESC"
 */
const char* toSql(OrderType order);

const char* toString(OrderType order);

/**
 * @brief Parse "name", "symbol" or "created_at", case-insensitively
 * @throws common::ValidationException for any other value
 */
AssetSortField parseSortField(const std::string& value);

/**
 * @return Column name for ORDER BY
 */
const char* sortColumn(AssetSortField field);

} // namespace models
} // namespace domain
