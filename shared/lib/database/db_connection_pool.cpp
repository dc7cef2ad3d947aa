/**
 * @file db_connection_pool.cpp
 * @brief PostgreSQL connection pool implementation
 */

#include "db_connection_pool.h"
#include "exceptions.h"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace common {

namespace {

// libpq keyword/value syntax: single-quote the value, escape ' and backslash
std::string quoteConnValue(const std::string& value) {
    std::string out = "'";
    for (char c : value) {
        if (c == '\'' || c == '\\') out += '\\';
        out += c;
    }
    out += "'";
    return out;
}

} // anonymous namespace

std::string DbPoolConfig::connString() const {
    return "host=" + quoteConnValue(host) +
           " port=" + std::to_string(port) +
           " dbname=" + quoteConnValue(dbName) +
           " user=" + quoteConnValue(user) +
           " password=" + quoteConnValue(password) +
           " connect_timeout=" + std::to_string(connectTimeoutSec) +
           " application_name=" + quoteConnValue(applicationName);
}

// =============================================================================
// PooledConnection
// =============================================================================

bool PooledConnection::execute(const char* sql) noexcept {
    if (!conn_) {
        return false;
    }

    PGresult* res = PQexec(conn_, sql);
    if (!res) {
        return false;
    }

    ExecStatusType status = PQresultStatus(res);
    bool ok = status == PGRES_COMMAND_OK || status == PGRES_TUPLES_OK;
    if (!ok) {
        spdlog::warn("[PooledConnection] '{}' failed: {}", sql, PQresultErrorMessage(res));
    }
    PQclear(res);
    return ok;
}

void PooledConnection::release() {
    if (!conn_) {
        return;
    }
    PGconn* conn = conn_;
    conn_ = nullptr;
    if (pool_) {
        pool_->giveBack(conn);
    } else {
        PQfinish(conn);
    }
}

// =============================================================================
// DbConnectionPool
// =============================================================================

DbConnectionPool::DbConnectionPool(const DbPoolConfig& config)
    : connString_(config.connString())
    , minSize_(config.minSize)
    , maxSize_(config.maxSize)
    , acquireTimeout_(config.acquireTimeoutSec)
{
    if (maxSize_ == 0) {
        throw std::invalid_argument("pool maxSize must be positive");
    }
    if (minSize_ > maxSize_) {
        throw std::invalid_argument("pool minSize cannot exceed maxSize");
    }

    spdlog::info("[DbConnectionPool] Created for {}:{}/{} (min={}, max={}, timeout={}s)",
                 config.host, config.port, config.dbName,
                 minSize_, maxSize_, config.acquireTimeoutSec);
}

DbConnectionPool::~DbConnectionPool() {
    shutdown();
}

bool DbConnectionPool::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);

    while (open_ < minSize_) {
        PGconn* conn = connect();
        if (!conn) {
            spdlog::error("[DbConnectionPool] Could not open connection {}/{}", open_ + 1, minSize_);
            return false;
        }
        idle_.push(conn);
        ++open_;
    }

    spdlog::info("[DbConnectionPool] Warmed up with {} connection(s)", open_);
    return true;
}

PooledConnection DbConnectionPool::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    const auto deadline = std::chrono::steady_clock::now() + acquireTimeout_;

    for (;;) {
        if (shutdown_) {
            throw StorageUnavailableException("connection pool is shut down");
        }

        while (!idle_.empty()) {
            PGconn* conn = idle_.front();
            idle_.pop();
            if (isHealthy(conn)) {
                return PooledConnection(conn, this);
            }
            spdlog::warn("[DbConnectionPool] Dropping broken idle connection");
            closeLocked(conn);
        }

        if (open_ < maxSize_) {
            // Count the slot before unlocking so concurrent callers respect maxSize
            ++open_;
            lock.unlock();
            PGconn* conn = connect();
            lock.lock();

            if (conn) {
                spdlog::debug("[DbConnectionPool] Opened connection {}/{}", open_, maxSize_);
                return PooledConnection(conn, this);
            }
            --open_;
            cv_.notify_one();
            throw StorageUnavailableException("failed to open database connection");
        }

        if (cv_.wait_until(lock, deadline) == std::cv_status::timeout) {
            spdlog::warn("[DbConnectionPool] No connection within {}s ({} open)",
                         acquireTimeout_.count(), open_);
            throw StorageUnavailableException("timed out acquiring database connection");
        }
    }
}

DbConnectionPool::Stats DbConnectionPool::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Stats{idle_.size(), open_, maxSize_};
}

void DbConnectionPool::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_) {
        return;
    }
    shutdown_ = true;

    while (!idle_.empty()) {
        closeLocked(idle_.front());
        idle_.pop();
    }
    cv_.notify_all();

    spdlog::info("[DbConnectionPool] Shut down ({} connection(s) still leased)", open_);
}

PGconn* DbConnectionPool::connect() {
    PGconn* conn = PQconnectdb(connString_.c_str());
    if (PQstatus(conn) != CONNECTION_OK) {
        spdlog::error("[DbConnectionPool] Connection failed: {}", PQerrorMessage(conn));
        PQfinish(conn);
        return nullptr;
    }
    return conn;
}

bool DbConnectionPool::isHealthy(PGconn* conn) {
    if (!conn || PQstatus(conn) != CONNECTION_OK) {
        return false;
    }
    PGresult* res = PQexec(conn, "SELECT 1");
    bool ok = res && PQresultStatus(res) == PGRES_TUPLES_OK;
    PQclear(res);
    return ok;
}

void DbConnectionPool::closeLocked(PGconn* conn) {
    PQfinish(conn);
    --open_;
}

void DbConnectionPool::giveBack(PGconn* conn) {
    // A transaction left open by a failed caller must not leak into the next lease
    if (PQstatus(conn) == CONNECTION_OK && PQtransactionStatus(conn) != PQTRANS_IDLE) {
        spdlog::warn("[DbConnectionPool] Connection returned inside a transaction, rolling back");
        PQclear(PQexec(conn, "ROLLBACK"));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_ || !isHealthy(conn)) {
        closeLocked(conn);
    } else {
        idle_.push(conn);
    }
    cv_.notify_one();
}

} // namespace common
