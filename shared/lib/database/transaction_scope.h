#pragma once

/**
 * @file transaction_scope.h
 * @brief Run an ordered list of writes as one unit of work
 */

#include "i_query_executor.h"
#include <functional>

namespace common {

/**
 * @brief Execute work inside a single transaction
 *
 * Commits only if work returns true. Rolls back if work returns false or
 * throws; the exception is rethrown unchanged after the rollback.
 *
 * @return true if committed, false if work declined and was rolled back
 */
bool runInTransaction(IQueryExecutor& executor,
                      const std::function<bool(ITransaction&)>& work);

} // namespace common
