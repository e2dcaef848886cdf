#include <database/bulk_copy.hpp>
#include <utils/logger.hpp>
#include <stdexcept>

namespace Arbor {

BulkCopy::BulkCopy(PostgresConnection& db) noexcept
    : db_(db) {}

BulkCopy::~BulkCopy() {
    if (!in_copy_) return;
    try {
        db_.copy_end("BulkCopy abandoned before flush");
    } catch (const std::exception& e) {
        // The server reports the abort as a failed COPY, which is what we asked for
        Logger::debug(std::string("BulkCopy abort: ") + e.what());
    }
}

void BulkCopy::begin_table(const std::string& table_name, const std::vector<std::string>& columns) {
    if (in_copy_) {
        throw std::runtime_error("BulkCopy: begin_table() called while COPY into " + table_ + " is active");
    }
    if (columns.empty()) {
        throw std::runtime_error("BulkCopy: no columns given for " + table_name);
    }

    table_ = table_name;
    columns_ = columns;
    row_count_ = 0;
    buffer_.str("");
    buffer_.clear();
}

void BulkCopy::escape_value_into_buffer(const std::string& value) {
    for (char c : value) {
        if (c == '\0') continue;
        switch (c) {
            case '\\': buffer_ << "\\\\"; break;
            case '\t': buffer_ << "\\t";  break;
            case '\n': buffer_ << "\\n";  break;
            case '\r': buffer_ << "\\r";  break;
            default:   buffer_ << c;      break;
        }
    }
}

void BulkCopy::start_copy_if_needed() {
    if (in_copy_) return;

    if (columns_.empty()) {
        throw std::runtime_error("BulkCopy: columns not set. Call begin_table() first.");
    }

    std::ostringstream copy_sql;
    copy_sql << "COPY " << PostgresConnection::quote_identifier(table_) << " (";
    for (size_t i = 0; i < columns_.size(); ++i) {
        if (i) copy_sql << ", ";
        copy_sql << PostgresConnection::quote_identifier(columns_[i]);
    }
    copy_sql << ") FROM STDIN";

    db_.execute(copy_sql.str());
    in_copy_ = true;
}

void BulkCopy::send_buffer() {
    std::string data = buffer_.str();
    if (!data.empty()) {
        db_.copy_data(data.c_str(), static_cast<int>(data.size()));
    }
    buffer_.str("");
    buffer_.clear();
}

void BulkCopy::add_row(const std::vector<std::string>& values) {
    start_copy_if_needed();

    const size_t ncols = columns_.size();
    for (size_t i = 0; i < ncols; ++i) {
        if (i) buffer_ << '\t';
        if (i < values.size() && !values[i].empty()) {
            escape_value_into_buffer(values[i]);
        } else {
            buffer_ << "\\N";
        }
    }
    buffer_ << '\n';
    ++row_count_;

    if ((row_count_ % DEFAULT_FLUSH_ROWS) == 0) {
        send_buffer();
    }
}

void BulkCopy::flush() {
    if (!in_copy_) return;

    send_buffer();
    in_copy_ = false;
    db_.copy_end(nullptr);

    total_rows_ += row_count_;
    row_count_ = 0;
}

} // namespace Arbor
