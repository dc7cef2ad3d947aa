#pragma once

#include "i_query_executor.h"
#include "db_connection_pool.h"
#include <libpq-fe.h>

/**
 * @file postgresql_query_executor.h
 * @brief libpq implementations of IQueryExecutor and ITransaction
 *
 * PostgreSQLQueryExecutor checks out a pooled connection per statement.
 * PostgreSQLTransaction keeps one connection checked out from BEGIN until
 * COMMIT/ROLLBACK.
 *
 * Driver errors are translated here, once, by SQLSTATE:
 * - 23505 unique_violation, 23503 foreign_key_violation -> ConflictException
 * - class 08 (connection exception), lost connection     -> StorageUnavailableException
 * - anything else                                         -> DatabaseException
 */

namespace common {

/**
 * @brief Pool-backed executor; every call is an independent auto-commit statement
 */
class PostgreSQLQueryExecutor : public IQueryExecutor {
public:
    /**
     * @throws std::invalid_argument if pool is nullptr
     */
    explicit PostgreSQLQueryExecutor(DbConnectionPool* pool);

    ~PostgreSQLQueryExecutor() override = default;

    Json::Value executeQuery(
        const std::string& query,
        const std::vector<std::string>& params = {}
    ) override;

    int executeCommand(
        const std::string& query,
        const std::vector<std::string>& params
    ) override;

    Json::Value executeScalar(
        const std::string& query,
        const std::vector<std::string>& params = {}
    ) override;

    std::unique_ptr<ITransaction> beginTransaction() override;

    std::string getDatabaseType() const override { return "postgres"; }

private:
    DbConnectionPool* pool_;  ///< non-owning
};

/**
 * @brief A transaction holding one pooled connection
 *
 * BEGIN runs in the constructor; the destructor issues ROLLBACK unless
 * commit() succeeded. The connection goes back to the pool when the
 * transaction object is destroyed.
 */
class PostgreSQLTransaction : public ITransaction {
public:
    /**
     * @throws DatabaseException if BEGIN fails
     */
    explicit PostgreSQLTransaction(PooledConnection conn);

    ~PostgreSQLTransaction() override;

    PostgreSQLTransaction(const PostgreSQLTransaction&) = delete;
    PostgreSQLTransaction& operator=(const PostgreSQLTransaction&) = delete;

    Json::Value executeQuery(
        const std::string& query,
        const std::vector<std::string>& params = {}
    ) override;

    int executeCommand(
        const std::string& query,
        const std::vector<std::string>& params
    ) override;

    Json::Value executeScalar(
        const std::string& query,
        const std::vector<std::string>& params = {}
    ) override;

    /**
     * @throws DatabaseException always; nested transactions are not supported
     */
    std::unique_ptr<ITransaction> beginTransaction() override;

    void commit() override;
    void rollback() noexcept override;
    bool isActive() const override { return active_; }

    std::string getDatabaseType() const override { return "postgres"; }

private:
    PooledConnection conn_;
    bool active_;

    void requireActive() const;
};

} // namespace common
