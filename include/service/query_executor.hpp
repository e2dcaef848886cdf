/**
 * @file query_executor.hpp
 * @brief Bounded worker pool for read-only store operations with timeouts and cancellation
 */

#pragma once

#include <export.hpp>
#include <utils/errors.hpp>
#include <utils/time.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace Arbor {

enum class QueryStatus {
    Queued,
    Running,
    Completed,
    Failed,
    TimedOut,
    Cancelled
};

ARBOR_API std::string_view to_string(QueryStatus status);

inline bool is_terminal(QueryStatus s) {
    return s != QueryStatus::Queued && s != QueryStatus::Running;
}

struct QueryStatsSnapshot {
    uint64_t submitted = 0;
    uint64_t succeeded = 0;
    uint64_t failed = 0;
    uint64_t timed_out = 0;
    uint64_t cancelled = 0;
};

/**
 * @brief Request outcome counters
 *
 * Owned by whoever creates the executors and passed in by reference, so
 * several executors can report into one set of counters.
 */
class ARBOR_API QueryStats {
public:
    void record_submitted() { submitted_.fetch_add(1, std::memory_order_relaxed); }
    void record(QueryStatus terminal);

    QueryStatsSnapshot snapshot() const;

private:
    std::atomic<uint64_t> submitted_{0};
    std::atomic<uint64_t> succeeded_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> timed_out_{0};
    std::atomic<uint64_t> cancelled_{0};
};

struct ActiveQuery {
    RequestId id = 0;
    std::string lane;
    std::string description;
    std::chrono::milliseconds elapsed{0};
    QueryStatus status = QueryStatus::Queued;
};

/**
 * @brief Caller-side signal that a request has been abandoned
 *
 * Copies share state. Hooks registered with on_cancel() run once, on the
 * thread that calls cancel(), outside the token's lock.
 */
class ARBOR_API CancellationToken {
public:
    using HookId = uint64_t;

    CancellationToken();

    void cancel();
    bool is_cancelled() const;

    // Runs hook immediately when the token is already cancelled.
    // Const: registration does not change whether the token is cancelled.
    HookId on_cancel(std::function<void()> hook) const;
    void remove(HookId id) const;

private:
    struct State {
        std::mutex mutex;
        bool cancelled = false;
        HookId next_id = 1;
        std::map<HookId, std::function<void()>> hooks;
    };
    std::shared_ptr<State> state_;
};

class QueryExecutor;

namespace detail {

struct QueryState {
    RequestId id = 0;
    std::string description;
    Timer::TimePoint submitted_at;
    std::chrono::milliseconds timeout{0};
    QueryExecutor* owner = nullptr;

    std::mutex mutex;
    std::condition_variable cv;
    QueryStatus status = QueryStatus::Queued;    // Guarded by mutex
    bool settling = false;                       // Guarded by mutex; one settle() owns the transition

    // Written by the worker before it settles the state; read only after
    std::exception_ptr error;
    std::string error_message;

    // Guarded by mutex
    std::optional<CancellationToken> token;
    CancellationToken::HookId hook = 0;

    virtual ~QueryState() = default;

    // Worker thread only. Never throws.
    virtual void run() noexcept = 0;

    Timer::TimePoint deadline() const { return submitted_at + timeout; }
};

template <typename R>
struct TypedState final : QueryState {
    std::function<R()> body;
    std::optional<R> result;

    void run() noexcept override {
        try {
            result.emplace(body());
        } catch (const std::exception& e) {
            error = std::current_exception();
            error_message = e.what();
        } catch (...) {
            error = std::current_exception();
            error_message = "non-standard exception";
        }
    }
};

} // namespace detail

/**
 * @brief Handle on one submitted unit of work
 *
 * get() blocks until the result is available, the request's deadline passes,
 * or the request is cancelled. Call it at most once.
 */
template <typename R>
class QueryTicket {
public:
    QueryTicket(std::shared_ptr<detail::TypedState<R>> state) : state_(std::move(state)) {}

    RequestId id() const { return state_->id; }

    QueryStatus status() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->status;
    }

    /**
     * @throws QueryTimeoutError when the deadline passes first
     * @throws QueryCancelledError when the request was cancelled
     * @throws whatever the work item threw
     */
    R get();

private:
    std::shared_ptr<detail::TypedState<R>> state_;
    bool consumed_ = false;
};

/**
 * @brief Fixed-size pool of worker threads draining a FIFO queue
 *
 * Work items must be read-only: once a caller stops waiting (timeout or
 * cancellation) an item that is already running still runs to completion and
 * its result is discarded. An item still queued at that point is skipped.
 *
 * Request ids are unique across every executor in the process. The
 * destructor cancels everything outstanding and joins the workers; tickets
 * must not outlive their executor.
 */
class ARBOR_API QueryExecutor {
public:
    static constexpr size_t MAX_DESCRIPTION = 120;

    QueryExecutor(std::string lane, size_t workers, QueryStats& stats);
    ~QueryExecutor();

    QueryExecutor(const QueryExecutor&) = delete;
    QueryExecutor& operator=(const QueryExecutor&) = delete;

    /**
     * @brief Queue a unit of work
     *
     * @param token optional caller token; cancelling it cancels this request
     */
    template <typename F>
    QueryTicket<std::invoke_result_t<F>> submit(std::string description, std::chrono::milliseconds timeout,
                                                 F&& body, const CancellationToken* token = nullptr);

    /**
     * @brief submit() and wait
     */
    template <typename F>
    std::invoke_result_t<F> run(std::string description, std::chrono::milliseconds timeout, F&& body,
                                const CancellationToken* token = nullptr) {
        return submit(std::move(description), timeout, std::forward<F>(body), token).get();
    }

    /**
     * @brief Cancel one outstanding request
     * @return false when the id is unknown or already finished
     */
    bool cancel(RequestId id);

    /**
     * @brief Cancel every outstanding request
     * @return how many were cancelled
     */
    size_t cancel_all();

    std::vector<ActiveQuery> active_queries() const;

    const std::string& lane() const { return lane_; }
    size_t worker_count() const { return workers_.size(); }
    size_t queued() const;

    /**
     * @brief Move a request to a terminal status and do the bookkeeping
     *
     * Counters and the active registry are updated before the status is
     * published, so a caller released by get() sees them already.
     *
     * @return false when the request had already reached a terminal status
     */
    bool settle(detail::QueryState& state, QueryStatus to);

private:
    void enqueue(std::shared_ptr<detail::QueryState> state, const CancellationToken* token);
    void worker();

    // Reached by cancellation hooks; cleared by the destructor so a token that
    // outlives this executor finds nothing to call
    struct Anchor {
        std::mutex mutex;
        QueryExecutor* executor = nullptr;
    };

    static std::atomic<RequestId> s_next_id_;

    std::shared_ptr<Anchor> anchor_;
    std::string lane_;
    QueryStats& stats_;

    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<std::shared_ptr<detail::QueryState>> queue_;
    bool stop_ = false;

    mutable std::mutex registry_mutex_;
    std::unordered_map<RequestId, std::shared_ptr<detail::QueryState>> registry_;

    std::vector<std::thread> workers_;
};

template <typename F>
QueryTicket<std::invoke_result_t<F>> QueryExecutor::submit(std::string description,
                                                            std::chrono::milliseconds timeout, F&& body,
                                                            const CancellationToken* token) {
    using R = std::invoke_result_t<F>;
    static_assert(!std::is_void_v<R>, "work items must return a value");

    auto state = std::make_shared<detail::TypedState<R>>();
    state->id = ++s_next_id_;
    if (description.size() > MAX_DESCRIPTION) {
        description.resize(MAX_DESCRIPTION - 3);
        description += "...";
    }
    state->description = std::move(description);
    state->submitted_at = Timer::Clock::now();
    state->timeout = timeout;
    state->owner = this;
    state->body = std::forward<F>(body);

    enqueue(state, token);
    return QueryTicket<R>(std::move(state));
}

template <typename R>
R QueryTicket<R>::get() {
    if (consumed_) {
        throw std::logic_error("QueryTicket::get() called twice for request " + std::to_string(state_->id));
    }
    consumed_ = true;

    detail::TypedState<R>& s = *state_;
    std::unique_lock<std::mutex> lock(s.mutex);
    if (!s.cv.wait_until(lock, s.deadline(), [&s] { return is_terminal(s.status); })) {
        lock.unlock();
        // Loses the race when the worker or a cancel settled it first; status says who won
        s.owner->settle(s, QueryStatus::TimedOut);
        lock.lock();
        s.cv.wait(lock, [&s] { return is_terminal(s.status); });
    }

    switch (s.status) {
        case QueryStatus::Completed:
            return std::move(*s.result);
        case QueryStatus::Failed:
            std::rethrow_exception(s.error);
        case QueryStatus::TimedOut:
            throw QueryTimeoutError(s.id, s.timeout);
        case QueryStatus::Cancelled:
            throw QueryCancelledError(s.id);
        default:
            throw std::logic_error("request " + std::to_string(s.id) + " left waiting in a non-terminal state");
    }
}

} // namespace Arbor
