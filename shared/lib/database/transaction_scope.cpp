#include "transaction_scope.h"
#include <spdlog/spdlog.h>
#include <exception>

namespace common {

bool runInTransaction(IQueryExecutor& executor,
                      const std::function<bool(ITransaction&)>& work)
{
    std::unique_ptr<ITransaction> tx = executor.beginTransaction();

    bool proceed = false;
    try {
        proceed = work(*tx);
    } catch (const std::exception& e) {
        spdlog::warn("[TransactionScope] Step failed, rolling back: {}", e.what());
        tx->rollback();
        throw;
    }

    if (!proceed) {
        spdlog::debug("[TransactionScope] Work declined, rolling back");
        tx->rollback();
        return false;
    }

    tx->commit();
    return true;
}

} // namespace common
