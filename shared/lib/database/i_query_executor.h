#pragma once

#include <string>
#include <vector>
#include <memory>
#include <json/json.h>

/**
 * @file i_query_executor.h
 * @brief Query executor and transaction interfaces
 *
 * Repositories talk to storage only through IQueryExecutor. Results are
 * returned as jsoncpp arrays of row objects keyed by column name, which
 * keeps repository code independent of libpq and lets tests substitute a
 * scripted executor.
 */

namespace common {

class ITransaction;

/**
 * @brief Parameterised SQL execution
 *
 * Parameters bind to $1, $2 ... placeholders. An empty string binds as SQL NULL.
 *
 * All methods translate driver failures into the registry exception
 * taxonomy (ConflictException, StorageUnavailableException, DatabaseException).
 */
class IQueryExecutor {
public:
    virtual ~IQueryExecutor() = default;

    /**
     * @brief Execute a row-returning statement
     * @return JSON array of row objects
     *
     * Example result:
     * [
     *   {"id": "Xq3...", "name": "Gold Bar", "listable": true},
     *   {"id": "b7Z...", "name": "Painting", "listable": false}
     * ]
     */
    virtual Json::Value executeQuery(
        const std::string& query,
        const std::vector<std::string>& params = {}
    ) = 0;

    /**
     * @brief Execute INSERT/UPDATE/DELETE
     * @return Number of affected rows
     */
    virtual int executeCommand(
        const std::string& query,
        const std::vector<std::string>& params
    ) = 0;

    /**
     * @brief Execute a query returning exactly one column of one row
     * @return The value, or null for SQL NULL
     * @throws DatabaseException if the result has no rows or more than one column
     */
    virtual Json::Value executeScalar(
        const std::string& query,
        const std::vector<std::string>& params = {}
    ) = 0;

    /**
     * @brief Start a unit of work pinned to a single connection
     *
     * The returned transaction has already issued BEGIN. It rolls back on
     * destruction unless commit() succeeded.
     */
    virtual std::unique_ptr<ITransaction> beginTransaction() = 0;

    /**
     * @return "postgres", or a test double's name
     */
    virtual std::string getDatabaseType() const = 0;
};

/**
 * @brief An open transaction
 *
 * Statements executed through it share one connection and become visible
 * to other sessions only after commit(). beginTransaction() on an open
 * transaction is not supported (no savepoints).
 */
class ITransaction : public IQueryExecutor {
public:
    ~ITransaction() override = default;

    /**
     * @throws DatabaseException if COMMIT fails; the transaction is then closed
     */
    virtual void commit() = 0;

    /**
     * @brief Roll back; a no-op once the transaction is closed
     */
    virtual void rollback() noexcept = 0;

    /**
     * @return true between BEGIN and commit()/rollback()
     */
    virtual bool isActive() const = 0;
};

} // namespace common
