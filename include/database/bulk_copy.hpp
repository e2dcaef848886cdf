#pragma once

#include <database/postgres_connection.hpp>
#include <sstream>
#include <string>
#include <vector>

namespace Arbor {

/**
 * @brief Streams many rows into a Postgres table using COPY ... FROM STDIN (text format).
 *
 * Usage:
 *   BulkCopy bc(conn);
 *   bc.begin_table("tree_edges", {"src", "dst"});
 *   for (...) bc.add_row({...});
 *   bc.flush();
 *
 * Notes:
 * - Not thread-safe; one instance per connection.
 * - flush() must be called explicitly. The destructor only aborts an unfinished COPY
 *   so the surrounding transaction can roll back cleanly.
 */
class ARBOR_API BulkCopy {
public:
    explicit BulkCopy(PostgresConnection& db) noexcept;
    ~BulkCopy();

    BulkCopy(const BulkCopy&) = delete;
    BulkCopy& operator=(const BulkCopy&) = delete;

    void begin_table(const std::string& table_name, const std::vector<std::string>& columns);

    // Empty strings become NULL.
    void add_row(const std::vector<std::string>& values);

    void flush();

    // Rows added since begin_table
    size_t count() const noexcept { return row_count_; }

    // Rows written by every flush() since construction
    size_t total_rows() const noexcept { return total_rows_; }

private:
    void start_copy_if_needed();
    void send_buffer();
    void escape_value_into_buffer(const std::string& value);

    PostgresConnection& db_;
    std::ostringstream buffer_;

    std::string table_;
    std::vector<std::string> columns_;
    size_t row_count_ = 0;
    size_t total_rows_ = 0;
    bool in_copy_ = false;

    static constexpr size_t DEFAULT_FLUSH_ROWS = 50000;
};

} // namespace Arbor
