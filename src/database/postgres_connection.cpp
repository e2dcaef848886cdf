/**
 * @file postgres_connection.cpp
 * @brief PostgreSQL connection implementation
 */

#include <database/postgres_connection.hpp>
#include <utils/logger.hpp>
#include <stdexcept>
#include <cstdlib>
#include <sstream>

namespace Arbor {

PostgresConnection::PostgresConnection() {
    std::ostringstream conninfo;

    const char* host = std::getenv("PGHOST");
    const char* port = std::getenv("PGPORT");
    const char* dbname = std::getenv("PGDATABASE");
    const char* user = std::getenv("PGUSER");
    const char* password = std::getenv("PGPASSWORD");

    conninfo << "host=" << (host ? host : "localhost") << " ";
    conninfo << "port=" << (port ? port : "5432") << " ";
    conninfo << "dbname=" << (dbname ? dbname : "arbor") << " ";
    conninfo << "user=" << (user ? user : "postgres") << " ";

    if (password) {
        conninfo << "password=" << password << " ";
    }

    connect(conninfo.str());
}

PostgresConnection::PostgresConnection(const std::string& conninfo) {
    connect(conninfo);
}

PostgresConnection::~PostgresConnection() {
    disconnect();
}

PostgresConnection::PostgresConnection(PostgresConnection&& other) noexcept
    : conn_(other.conn_), last_error_(std::move(other.last_error_)) {
    other.conn_ = nullptr;
}

PostgresConnection& PostgresConnection::operator=(PostgresConnection&& other) noexcept {
    if (this != &other) {
        disconnect();
        conn_ = other.conn_;
        last_error_ = std::move(other.last_error_);
        other.conn_ = nullptr;
    }
    return *this;
}

void PostgresConnection::connect(const std::string& conninfo) {
    conn_ = PQconnectdb(conninfo.c_str());

    if (PQstatus(conn_) != CONNECTION_OK) {
        last_error_ = PQerrorMessage(conn_);
        PQfinish(conn_);
        conn_ = nullptr;
        throw std::runtime_error("PostgreSQL connection failed: " + last_error_);
    }

    // Every identifier and bound literal we send is plain ASCII
    execute("SET client_encoding = 'UTF8'");
}

void PostgresConnection::disconnect() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

bool PostgresConnection::is_connected() const {
    return conn_ && PQstatus(conn_) == CONNECTION_OK;
}

void PostgresConnection::ensure_connected() const {
    if (!is_connected()) {
        throw std::runtime_error("Not connected to database");
    }
}

void PostgresConnection::check_result(PGresult* result) {
    ExecStatusType status = PQresultStatus(result);

    if (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK &&
        status != PGRES_COPY_IN && status != PGRES_COPY_OUT) {
        last_error_ = PQerrorMessage(conn_);
        PQclear(result);
        throw std::runtime_error("PostgreSQL query failed: " + last_error_);
    }
}

PGresult* PostgresConnection::exec_params(const std::string& sql, const std::vector<std::string>& params) {
    ensure_connected();

    std::vector<const char*> param_values;
    param_values.reserve(params.size());
    for (const auto& p : params) {
        param_values.push_back(p.c_str());
    }

    PGresult* result = PQexecParams(
        conn_,
        sql.c_str(),
        static_cast<int>(params.size()),
        nullptr,
        param_values.data(),
        nullptr,
        nullptr,
        0  // Text format
    );

    check_result(result);
    return result;
}

void PostgresConnection::for_each_row(PGresult* result, const RowCallback& callback) {
    const int nrows = PQntuples(result);
    const int nfields = PQnfields(result);

    Row row;
    row.reserve(nfields);
    for (int i = 0; i < nrows; ++i) {
        row.clear();
        for (int j = 0; j < nfields; ++j) {
            row.emplace_back(PQgetvalue(result, i, j));
        }
        callback(row);
    }
}

void PostgresConnection::execute(const std::string& sql) {
    ensure_connected();

    PGresult* result = PQexec(conn_, sql.c_str());
    check_result(result);
    PQclear(result);
}

void PostgresConnection::execute(const std::string& sql, const std::vector<std::string>& params) {
    PQclear(exec_params(sql, params));
}

std::optional<std::string> PostgresConnection::query_single(const std::string& sql) {
    return query_single(sql, {});
}

std::optional<std::string> PostgresConnection::query_single(const std::string& sql, const std::vector<std::string>& params) {
    PGresult* result = exec_params(sql, params);

    std::optional<std::string> value;
    if (PQntuples(result) > 0 && PQnfields(result) > 0 && !PQgetisnull(result, 0, 0)) {
        value = PQgetvalue(result, 0, 0);
    }

    PQclear(result);
    return value;
}

void PostgresConnection::query(const std::string& sql, const RowCallback& callback) {
    query(sql, {}, callback);
}

void PostgresConnection::query(const std::string& sql, const std::vector<std::string>& params,
                               const RowCallback& callback) {
    PGresult* result = exec_params(sql, params);
    try {
        for_each_row(result, callback);
    } catch (...) {
        PQclear(result);
        throw;
    }
    PQclear(result);
}

void PostgresConnection::copy_data(const char* buffer, int nbytes) {
    ensure_connected();

    if (PQputCopyData(conn_, buffer, nbytes) == -1) {
        last_error_ = PQerrorMessage(conn_);
        throw std::runtime_error("COPY data failed: " + last_error_);
    }
}

void PostgresConnection::copy_end(const char* error_msg) {
    ensure_connected();

    if (PQputCopyEnd(conn_, error_msg) == -1) {
        last_error_ = PQerrorMessage(conn_);
        throw std::runtime_error("COPY end failed: " + last_error_);
    }

    // Drain results; the COPY outcome is the first one
    PGresult* res = PQgetResult(conn_);
    check_result(res);
    PQclear(res);
    while ((res = PQgetResult(conn_)) != nullptr) {
        PQclear(res);
    }
}

void PostgresConnection::begin() {
    execute("BEGIN");
}

void PostgresConnection::commit() {
    execute("COMMIT");
}

void PostgresConnection::rollback() {
    execute("ROLLBACK");
}

std::string PostgresConnection::last_error() const {
    return last_error_;
}

std::string PostgresConnection::quote_identifier(const std::string& id) {
    std::string out;
    out.reserve(id.size() + 4);
    out.push_back('"');
    for (char c : id) {
        if (c == '"') out.append("\"\"");
        else if (c == '.') out.append("\".\"");
        else out.push_back(c);
    }
    out.push_back('"');
    return out;
}

std::string PostgresConnection::array_literal(std::span<const std::int64_t> ids) {
    std::string out;
    out.reserve(ids.size() * 8 + 2);
    out.push_back('{');
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i) out.push_back(',');
        out.append(std::to_string(ids[i]));
    }
    out.push_back('}');
    return out;
}

// Transaction RAII
PostgresConnection::Transaction::Transaction(PostgresConnection& conn) : conn_(conn) {
    conn_.begin();
}

PostgresConnection::Transaction::~Transaction() {
    if (!committed_ && !rolled_back_) {
        try {
            conn_.rollback();
        } catch (const std::exception& e) {
            Logger::warn(std::string("Rollback failed: ") + e.what());
        }
    }
}

void PostgresConnection::Transaction::commit() {
    conn_.commit();
    committed_ = true;
}

void PostgresConnection::Transaction::rollback() {
    conn_.rollback();
    rolled_back_ = true;
}

} // namespace Arbor
