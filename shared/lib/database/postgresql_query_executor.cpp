#include "postgresql_query_executor.h"
#include "exceptions.h"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <cstdlib>
#include <cstring>
#include <string>

namespace common {

namespace {

// PostgreSQL type OIDs (pg_type.h)
constexpr Oid OID_BOOL = 16;
constexpr Oid OID_INT8 = 20;
constexpr Oid OID_INT2 = 21;
constexpr Oid OID_INT4 = 23;
constexpr Oid OID_FLOAT4 = 700;
constexpr Oid OID_FLOAT8 = 701;

/**
 * @brief Throw the registry exception matching a failed result; clears res
 */
[[noreturn]] void throwForFailure(PGconn* conn, PGresult* res) {
    std::string sqlState;
    std::string message;

    if (res) {
        const char* state = PQresultErrorField(res, PG_DIAG_SQLSTATE);
        if (state) sqlState = state;
        const char* detail = PQresultErrorField(res, PG_DIAG_MESSAGE_PRIMARY);
        message = detail ? detail : PQresultErrorMessage(res);
        PQclear(res);
    } else {
        message = PQerrorMessage(conn);
    }

    spdlog::error("[PostgreSQLQueryExecutor] Statement failed (sqlstate={}): {}",
                  sqlState.empty() ? "none" : sqlState, message);

    if (sqlState == "23505") {
        throw ConflictException("unique constraint violated: " + message);
    }
    if (sqlState == "23503") {
        throw ConflictException("foreign key constraint violated: " + message);
    }
    if (sqlState.compare(0, 2, "08") == 0 || PQstatus(conn) != CONNECTION_OK) {
        throw StorageUnavailableException(message);
    }
    throw DatabaseException(message);
}

/**
 * @brief PQexecParams with NULL-for-empty binding; caller owns the result
 */
PGresult* execParams(PGconn* conn, const std::string& query,
                     const std::vector<std::string>& params) {
    spdlog::debug("[PostgreSQLQueryExecutor] Query: {} (params: {})", query, params.size());

    std::vector<const char*> paramValues;
    paramValues.reserve(params.size());
    for (const auto& param : params) {
        paramValues.push_back(param.empty() ? nullptr : param.c_str());
    }

    PGresult* res = PQexecParams(
        conn,
        query.c_str(),
        static_cast<int>(params.size()),
        nullptr,                                // infer types
        paramValues.empty() ? nullptr : paramValues.data(),
        nullptr,                                // text params
        nullptr,
        0                                       // text results
    );

    if (!res) {
        throwForFailure(conn, nullptr);
    }

    ExecStatusType status = PQresultStatus(res);
    if (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK) {
        throwForFailure(conn, res);
    }
    return res;
}

Json::Value fieldToJson(PGresult* res, int row, int col) {
    if (PQgetisnull(res, row, col)) {
        return Json::nullValue;
    }

    const char* value = PQgetvalue(res, row, col);
    switch (PQftype(res, col)) {
        case OID_INT2:
        case OID_INT4:
        case OID_INT8:
            return Json::Value(static_cast<Json::Int64>(std::strtoll(value, nullptr, 10)));
        case OID_FLOAT4:
        case OID_FLOAT8:
            return Json::Value(std::strtod(value, nullptr));
        case OID_BOOL:
            return Json::Value(value[0] == 't');
        default:
            return Json::Value(value);
    }
}

Json::Value resultToJson(PGresult* res) {
    Json::Value array = Json::arrayValue;

    int rows = PQntuples(res);
    int cols = PQnfields(res);

    for (int i = 0; i < rows; ++i) {
        Json::Value row(Json::objectValue);
        for (int j = 0; j < cols; ++j) {
            row[PQfname(res, j)] = fieldToJson(res, i, j);
        }
        array.append(row);
    }
    return array;
}

int affectedRows(PGresult* res) {
    const char* tuples = PQcmdTuples(res);
    if (!tuples || tuples[0] == '\0') {
        return 0;
    }
    return std::atoi(tuples);
}

Json::Value scalarFromResult(PGresult* res) {
    if (PQntuples(res) == 0) {
        PQclear(res);
        throw DatabaseException("scalar query returned no rows");
    }
    if (PQnfields(res) != 1) {
        PQclear(res);
        throw DatabaseException("scalar query must return exactly one column");
    }
    Json::Value value = fieldToJson(res, 0, 0);
    PQclear(res);
    return value;
}

Json::Value runQuery(PGconn* conn, const std::string& query, const std::vector<std::string>& params) {
    PGresult* res = execParams(conn, query, params);
    Json::Value rows = resultToJson(res);
    PQclear(res);
    return rows;
}

int runCommand(PGconn* conn, const std::string& query, const std::vector<std::string>& params) {
    PGresult* res = execParams(conn, query, params);
    int rows = affectedRows(res);
    PQclear(res);
    spdlog::debug("[PostgreSQLQueryExecutor] Command affected {} rows", rows);
    return rows;
}

} // anonymous namespace

// ============================================================================
// PostgreSQLQueryExecutor
// ============================================================================

PostgreSQLQueryExecutor::PostgreSQLQueryExecutor(DbConnectionPool* pool)
    : pool_(pool)
{
    if (!pool_) {
        throw std::invalid_argument("PostgreSQLQueryExecutor: pool cannot be nullptr");
    }
    spdlog::debug("[PostgreSQLQueryExecutor] Initialized");
}

Json::Value PostgreSQLQueryExecutor::executeQuery(
    const std::string& query,
    const std::vector<std::string>& params)
{
    auto conn = pool_->acquire();
    return runQuery(conn.get(), query, params);
}

int PostgreSQLQueryExecutor::executeCommand(
    const std::string& query,
    const std::vector<std::string>& params)
{
    auto conn = pool_->acquire();
    return runCommand(conn.get(), query, params);
}

Json::Value PostgreSQLQueryExecutor::executeScalar(
    const std::string& query,
    const std::vector<std::string>& params)
{
    auto conn = pool_->acquire();
    return scalarFromResult(execParams(conn.get(), query, params));
}

std::unique_ptr<ITransaction> PostgreSQLQueryExecutor::beginTransaction() {
    return std::make_unique<PostgreSQLTransaction>(pool_->acquire());
}

// ============================================================================
// PostgreSQLTransaction
// ============================================================================

PostgreSQLTransaction::PostgreSQLTransaction(PooledConnection conn)
    : conn_(std::move(conn)), active_(false)
{
    if (!conn_.isValid()) {
        throw StorageUnavailableException("transaction requires a valid connection");
    }
    PQclear(execParams(conn_.get(), "BEGIN", {}));
    active_ = true;
    spdlog::debug("[PostgreSQLTransaction] BEGIN");
}

PostgreSQLTransaction::~PostgreSQLTransaction() {
    if (active_) {
        spdlog::debug("[PostgreSQLTransaction] Not committed, rolling back");
        rollback();
    }
}

void PostgreSQLTransaction::requireActive() const {
    if (!active_) {
        throw DatabaseException("transaction is no longer active");
    }
}

Json::Value PostgreSQLTransaction::executeQuery(
    const std::string& query,
    const std::vector<std::string>& params)
{
    requireActive();
    return runQuery(conn_.get(), query, params);
}

int PostgreSQLTransaction::executeCommand(
    const std::string& query,
    const std::vector<std::string>& params)
{
    requireActive();
    return runCommand(conn_.get(), query, params);
}

Json::Value PostgreSQLTransaction::executeScalar(
    const std::string& query,
    const std::vector<std::string>& params)
{
    requireActive();
    return scalarFromResult(execParams(conn_.get(), query, params));
}

std::unique_ptr<ITransaction> PostgreSQLTransaction::beginTransaction() {
    throw DatabaseException("nested transactions are not supported");
}

void PostgreSQLTransaction::commit() {
    requireActive();
    // Closed whether or not COMMIT succeeds; the server aborts a failed commit itself
    active_ = false;
    PQclear(execParams(conn_.get(), "COMMIT", {}));
    spdlog::debug("[PostgreSQLTransaction] COMMIT");
}

void PostgreSQLTransaction::rollback() noexcept {
    if (!active_) {
        return;
    }
    active_ = false;
    if (!conn_.execute("ROLLBACK")) {
        spdlog::error("[PostgreSQLTransaction] ROLLBACK failed: {}", PQerrorMessage(conn_.get()));
        return;
    }
    spdlog::debug("[PostgreSQLTransaction] ROLLBACK");
}

} // namespace common
