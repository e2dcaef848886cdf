#include <database/connection_pool.hpp>
#include <stdexcept>

namespace Arbor {

PostgresConnectionPool::PostgresConnectionPool(std::string conninfo, size_t max_size)
    : conninfo_(std::move(conninfo)), max_size_(max_size) {
    if (max_size_ == 0) {
        throw std::invalid_argument("PostgresConnectionPool: max_size must be at least 1");
    }
}

PostgresConnectionPool::Lease::~Lease() {
    if (conn_) {
        pool_->release(std::move(conn_));
    }
}

PostgresConnectionPool::Lease PostgresConnectionPool::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !idle_.empty() || open_ < max_size_; });

    if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Lease(*this, std::move(conn));
    }

    // Reserve the slot, then connect without holding the lock
    ++open_;
    lock.unlock();
    try {
        return Lease(*this, std::make_unique<PostgresConnection>(conninfo_));
    } catch (...) {
        lock.lock();
        --open_;
        lock.unlock();
        cv_.notify_one();
        throw;
    }
}

void PostgresConnectionPool::release(std::unique_ptr<PostgresConnection> conn) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (conn->is_connected()) {
            idle_.push_back(std::move(conn));
        } else {
            --open_;
        }
    }
    cv_.notify_one();
}

size_t PostgresConnectionPool::idle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return idle_.size();
}

} // namespace Arbor
