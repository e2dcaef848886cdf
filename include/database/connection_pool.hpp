#pragma once

#include <database/postgres_connection.hpp>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace Arbor {

/**
 * @brief Bounded set of PostgresConnections handed out one per thread at a time.
 *
 * Connections are opened lazily up to max_size. acquire() blocks when all are
 * leased. A lease returns its connection on destruction; a connection that
 * has dropped is discarded instead of being returned.
 */
class ARBOR_API PostgresConnectionPool {
public:
    class Lease {
    public:
        Lease(PostgresConnectionPool& pool, std::unique_ptr<PostgresConnection> conn)
            : pool_(&pool), conn_(std::move(conn)) {}
        ~Lease();

        Lease(Lease&& other) noexcept : pool_(other.pool_), conn_(std::move(other.conn_)) {}
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        Lease& operator=(Lease&&) = delete;

        PostgresConnection& operator*() { return *conn_; }
        PostgresConnection* operator->() { return conn_.get(); }

    private:
        PostgresConnectionPool* pool_;
        std::unique_ptr<PostgresConnection> conn_;
    };

    PostgresConnectionPool(std::string conninfo, size_t max_size);

    PostgresConnectionPool(const PostgresConnectionPool&) = delete;
    PostgresConnectionPool& operator=(const PostgresConnectionPool&) = delete;

    Lease acquire();

    size_t max_size() const { return max_size_; }
    size_t idle() const;

private:
    void release(std::unique_ptr<PostgresConnection> conn);

    std::string conninfo_;
    size_t max_size_;
    size_t open_ = 0;
    std::vector<std::unique_ptr<PostgresConnection>> idle_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace Arbor
