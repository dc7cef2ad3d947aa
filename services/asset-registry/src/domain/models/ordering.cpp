#include "ordering.h"
#include "exceptions.h"
#include "registry/utils/string_utils.h"

namespace domain {
namespace models {

OrderType parseOrderType(const std::string& value) {
    std::string normalized = registry::utils::toLower(registry::utils::trim(value));

    if (normalized == "asc" || normalized == "ascending") {
        return OrderType::Ascending;
    }
    if (normalized == "desc" || normalized == "descending") {
        return OrderType::Descending;
    }
    throw common::ValidationException("unknown sort order '" + value +
                                      "' (expected asc, ascending, desc or descending)");
}

const char* toSql(OrderType order) {
    return order == OrderType::Descending ? "DESC" : "ASC";
}

const char* toString(OrderType order) {
    return order == OrderType::Descending ? "descending" : "ascending";
}

AssetSortField parseSortField(const std::string& value) {
    std::string normalized = registry::utils::toLower(registry::utils::trim(value));

    if (normalized == "name") return AssetSortField::Name;
    if (normalized == "symbol") return AssetSortField::Symbol;
    if (normalized == "created_at") return AssetSortField::CreatedAt;

    throw common::ValidationException("unknown sort field '" + value +
                                      "' (expected name, symbol or created_at)");
}

const char* sortColumn(AssetSortField field) {
    switch (field) {
        case AssetSortField::Symbol:    return "symbol";
        case AssetSortField::CreatedAt: return "created_at";
        case AssetSortField::Name:      break;
    }
    return "name";
}

} // namespace models
} // namespace domain
