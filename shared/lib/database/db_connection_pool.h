/**
 * @file db_connection_pool.h
 * @brief PostgreSQL connection pool
 *
 * Thread-safe pool of libpq connections. Connections are checked for
 * health before they are handed out, and a connection returned with an
 * open transaction is rolled back before it can be reused.
 */

#pragma once

#include <libpq-fe.h>
#include <string>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <cstddef>

namespace common {

/**
 * @brief Connection settings and pool bounds
 */
struct DbPoolConfig {
    std::string host = "localhost";
    int port = 5432;
    std::string dbName;
    std::string user;
    std::string password;

    size_t minSize = 2;
    size_t maxSize = 10;
    int acquireTimeoutSec = 5;
    int connectTimeoutSec = 5;
    std::string applicationName = "asset-registry";

    /**
     * @brief libpq keyword/value connection string; values are quoted
     */
    std::string connString() const;
};

class DbConnectionPool;

/**
 * @brief RAII lease of one pooled PGconn
 *
 * Goes back to the pool when destroyed. Movable so a transaction can
 * keep the same connection for its whole lifetime.
 */
class PooledConnection {
public:
    PooledConnection(PGconn* conn, DbConnectionPool* pool)
        : conn_(conn), pool_(pool) {}

    ~PooledConnection() { release(); }

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    PooledConnection(PooledConnection&& other) noexcept
        : conn_(other.conn_), pool_(other.pool_) {
        other.conn_ = nullptr;
    }
    PooledConnection& operator=(PooledConnection&&) = delete;

    PGconn* get() const { return conn_; }

    bool isValid() const { return conn_ != nullptr; }

    /**
     * @brief Run a parameterless statement (BEGIN, ROLLBACK ...)
     * @return true if the server accepted it
     */
    bool execute(const char* sql) noexcept;

    /**
     * @brief Hand the connection back early; later calls are no-ops
     */
    void release();

private:
    PGconn* conn_;
    DbConnectionPool* pool_;  // non-owning
};

class DbConnectionPool {
public:
    struct Stats {
        size_t availableConnections;
        size_t totalConnections;
        size_t maxConnections;
    };

    /**
     * @throws std::invalid_argument if maxSize is 0 or minSize > maxSize
     */
    explicit DbConnectionPool(const DbPoolConfig& config);

    ~DbConnectionPool();

    DbConnectionPool(const DbConnectionPool&) = delete;
    DbConnectionPool& operator=(const DbConnectionPool&) = delete;

    /**
     * @brief Open minSize connections up front
     * @return false if any of them could not be opened
     */
    bool initialize();

    /**
     * @brief Lease a connection, waiting up to the acquire timeout
     * @throws StorageUnavailableException on timeout, connect failure or after shutdown
     */
    PooledConnection acquire();

    Stats getStats() const;

    /**
     * @brief Close idle connections; leased ones are closed when returned
     */
    void shutdown();

private:
    friend class PooledConnection;

    std::string connString_;
    size_t minSize_;
    size_t maxSize_;
    std::chrono::seconds acquireTimeout_;

    std::queue<PGconn*> idle_;
    size_t open_ = 0;
    bool shutdown_ = false;
    mutable std::mutex mutex_;
    std::condition_variable cv_;

    PGconn* connect();
    static bool isHealthy(PGconn* conn);
    void closeLocked(PGconn* conn);

    void giveBack(PGconn* conn);
};

} // namespace common
