/**
 * @file postgres_connection.hpp
 * @brief PostgreSQL connection and query interface
 */

#pragma once

#include <export.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <vector>
#include <libpq-fe.h>

namespace Arbor {

/**
 * @brief PostgreSQL connection wrapper
 *
 * Owns one libpq connection. Not thread-safe: every thread that talks to the
 * database holds its own instance (see PostgresConnectionPool).
 */
class ARBOR_API PostgresConnection {
public:
    using Row = std::vector<std::string>;
    using RowCallback = std::function<void(const Row&)>;

    /**
     * @brief Connect using the libpq environment (PGHOST, PGPORT, PGDATABASE, PGUSER, PGPASSWORD)
     */
    PostgresConnection();

    /**
     * @brief Connect with explicit connection string
     */
    explicit PostgresConnection(const std::string& conninfo);

    ~PostgresConnection();

    PostgresConnection(const PostgresConnection&) = delete;
    PostgresConnection& operator=(const PostgresConnection&) = delete;

    PostgresConnection(PostgresConnection&& other) noexcept;
    PostgresConnection& operator=(PostgresConnection&& other) noexcept;

    bool is_connected() const;

    void execute(const std::string& sql);
    void execute(const std::string& sql, const std::vector<std::string>& params);

    std::optional<std::string> query_single(const std::string& sql);
    std::optional<std::string> query_single(const std::string& sql, const std::vector<std::string>& params);

    /**
     * @brief Execute query and iterate rows
     *
     * NULL fields arrive as empty strings; use is_null-aware SQL (COALESCE) where it matters.
     */
    void query(const std::string& sql, const RowCallback& callback);
    void query(const std::string& sql, const std::vector<std::string>& params, const RowCallback& callback);

    // COPY ... FROM STDIN streaming (used by BulkCopy)
    void copy_data(const char* buffer, int nbytes);
    void copy_end(const char* error_msg = nullptr);

    void begin();
    void commit();
    void rollback();

    /**
     * @brief RAII transaction guard. Rolls back unless commit() was called.
     */
    class ARBOR_API Transaction {
    public:
        explicit Transaction(PostgresConnection& conn);
        ~Transaction();

        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;

        void commit();
        void rollback();

    private:
        PostgresConnection& conn_;
        bool committed_ = false;
        bool rolled_back_ = false;
    };

    std::string last_error() const;

    /**
     * @brief Quote an identifier ("schema"."table" when a dot is present)
     */
    static std::string quote_identifier(const std::string& id);

    /**
     * @brief Render ids as a Postgres array literal, e.g. "{1,2,3}", for binding as $n::bigint[]
     */
    static std::string array_literal(std::span<const std::int64_t> ids);

private:
    void connect(const std::string& conninfo);
    void disconnect();
    void ensure_connected() const;
    PGresult* exec_params(const std::string& sql, const std::vector<std::string>& params);
    void check_result(PGresult* result);
    static void for_each_row(PGresult* result, const RowCallback& callback);

    PGconn* conn_ = nullptr;
    std::string last_error_;
};

} // namespace Arbor
