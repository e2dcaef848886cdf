#include <service/query_executor.hpp>
#include <utils/logger.hpp>

namespace Arbor {

std::atomic<RequestId> QueryExecutor::s_next_id_{0};

std::string_view to_string(QueryStatus status) {
    switch (status) {
        case QueryStatus::Queued:    return "queued";
        case QueryStatus::Running:   return "running";
        case QueryStatus::Completed: return "completed";
        case QueryStatus::Failed:    return "failed";
        case QueryStatus::TimedOut:  return "timed_out";
        case QueryStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

// ============================================================================
// QueryStats
// ============================================================================

void QueryStats::record(QueryStatus terminal) {
    switch (terminal) {
        case QueryStatus::Completed: succeeded_.fetch_add(1, std::memory_order_relaxed); break;
        case QueryStatus::Failed:    failed_.fetch_add(1, std::memory_order_relaxed);    break;
        case QueryStatus::TimedOut:  timed_out_.fetch_add(1, std::memory_order_relaxed); break;
        case QueryStatus::Cancelled: cancelled_.fetch_add(1, std::memory_order_relaxed); break;
        default: break;
    }
}

QueryStatsSnapshot QueryStats::snapshot() const {
    QueryStatsSnapshot s;
    s.submitted = submitted_.load(std::memory_order_relaxed);
    s.succeeded = succeeded_.load(std::memory_order_relaxed);
    s.failed = failed_.load(std::memory_order_relaxed);
    s.timed_out = timed_out_.load(std::memory_order_relaxed);
    s.cancelled = cancelled_.load(std::memory_order_relaxed);
    return s;
}

// ============================================================================
// CancellationToken
// ============================================================================

CancellationToken::CancellationToken() : state_(std::make_shared<State>()) {}

void CancellationToken::cancel() {
    std::map<HookId, std::function<void()>> hooks;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->cancelled) return;
        state_->cancelled = true;
        hooks.swap(state_->hooks);
    }
    for (auto& [id, hook] : hooks) {
        hook();
    }
}

bool CancellationToken::is_cancelled() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

CancellationToken::HookId CancellationToken::on_cancel(std::function<void()> hook) const {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->cancelled) {
            const HookId id = state_->next_id++;
            state_->hooks.emplace(id, std::move(hook));
            return id;
        }
    }
    hook();
    return 0;
}

void CancellationToken::remove(HookId id) const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->hooks.erase(id);
}

// ============================================================================
// QueryExecutor
// ============================================================================

QueryExecutor::QueryExecutor(std::string lane, size_t workers, QueryStats& stats)
    : anchor_(std::make_shared<Anchor>()), lane_(std::move(lane)), stats_(stats) {
    if (workers == 0) {
        throw std::invalid_argument("QueryExecutor '" + lane_ + "': at least one worker required");
    }
    anchor_->executor = this;
    workers_.reserve(workers);
    for (size_t i = 0; i < workers; ++i)
        workers_.emplace_back(&QueryExecutor::worker, this);
}

QueryExecutor::~QueryExecutor() {
    {
        // Waits for a hook that is mid-call
        std::lock_guard<std::mutex> lock(anchor_->mutex);
        anchor_->executor = nullptr;
    }

    const size_t cancelled = cancel_all();
    if (cancelled > 0) {
        Logger::debug("Executor '" + lane_ + "' shutting down, cancelled " + std::to_string(cancelled) + " requests");
    }
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }
    queue_cv_.notify_all();
    for (auto& t : workers_)
        if (t.joinable()) t.join();
}

void QueryExecutor::enqueue(std::shared_ptr<detail::QueryState> state, const CancellationToken* token) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stop_) {
            throw std::runtime_error("Executor '" + lane_ + "' is shutting down");
        }
    }

    stats_.record_submitted();
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        registry_.emplace(state->id, state);
    }

    if (token) {
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            state->token = *token;
        }
        const RequestId id = state->id;
        const auto hook = token->on_cancel([anchor = std::weak_ptr<Anchor>(anchor_), id] {
            auto live = anchor.lock();
            if (!live) return;
            std::lock_guard<std::mutex> lock(live->mutex);
            if (live->executor) live->executor->cancel(id);
        });
        std::lock_guard<std::mutex> lock(state->mutex);
        state->hook = hook;
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        queue_.push_back(std::move(state));
    }
    queue_cv_.notify_one();
}

bool QueryExecutor::settle(detail::QueryState& state, QueryStatus to) {
    std::optional<CancellationToken> token;
    CancellationToken::HookId hook = 0;
    {
        std::lock_guard<std::mutex> lock(state.mutex);
        if (is_terminal(state.status)) return false;
        if ((to == QueryStatus::Completed || to == QueryStatus::Failed) && state.status != QueryStatus::Running) {
            return false;
        }
        if (state.settling) return false;
        state.settling = true;
        token = state.token;
        hook = state.hook;
    }

    stats_.record(to);
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        registry_.erase(state.id);
    }
    if (token && hook) {
        token->remove(hook);
    }

    {
        std::lock_guard<std::mutex> lock(state.mutex);
        state.status = to;
    }
    state.cv.notify_all();

    switch (to) {
        case QueryStatus::TimedOut:
            Logger::warn("Request " + std::to_string(state.id) + " [" + lane_ + "] timed out after " +
                         std::to_string(state.timeout.count()) + "ms: " + state.description);
            break;
        case QueryStatus::Cancelled:
            Logger::debug("Request " + std::to_string(state.id) + " [" + lane_ + "] cancelled: " + state.description);
            break;
        case QueryStatus::Failed:
            Logger::error("Request " + std::to_string(state.id) + " [" + lane_ + "] failed: " + state.error_message);
            break;
        default:
            break;
    }
    return true;
}

bool QueryExecutor::cancel(RequestId id) {
    std::shared_ptr<detail::QueryState> state;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        auto it = registry_.find(id);
        if (it == registry_.end()) return false;
        state = it->second;
    }
    return settle(*state, QueryStatus::Cancelled);
}

size_t QueryExecutor::cancel_all() {
    std::vector<std::shared_ptr<detail::QueryState>> outstanding;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        outstanding.reserve(registry_.size());
        for (const auto& [id, state] : registry_) {
            outstanding.push_back(state);
        }
    }

    size_t cancelled = 0;
    for (auto& state : outstanding) {
        if (settle(*state, QueryStatus::Cancelled)) ++cancelled;
    }
    return cancelled;
}

std::vector<ActiveQuery> QueryExecutor::active_queries() const {
    std::vector<ActiveQuery> out;
    std::lock_guard<std::mutex> lock(registry_mutex_);
    out.reserve(registry_.size());
    for (const auto& [id, state] : registry_) {
        ActiveQuery q;
        q.id = id;
        q.lane = lane_;
        q.description = state->description;
        q.elapsed = Timer::since(state->submitted_at);
        {
            std::lock_guard<std::mutex> state_lock(state->mutex);
            q.status = state->status;
        }
        if (!is_terminal(q.status)) {
            out.push_back(std::move(q));
        }
    }
    return out;
}

size_t QueryExecutor::queued() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return queue_.size();
}

void QueryExecutor::worker() {
    while (true) {
        std::shared_ptr<detail::QueryState> item;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return stop_ || !queue_.empty(); });
            if (queue_.empty()) break;
            item = std::move(queue_.front());
            queue_.pop_front();
        }

        bool expired = false;
        {
            std::lock_guard<std::mutex> lock(item->mutex);
            if (item->status != QueryStatus::Queued || item->settling) continue;   // Caller already gave up
            if (Timer::Clock::now() >= item->deadline()) {
                expired = true;
            } else {
                item->status = QueryStatus::Running;
            }
        }

        if (expired) {
            settle(*item, QueryStatus::TimedOut);
            continue;
        }

        item->run();

        if (!settle(*item, item->error ? QueryStatus::Failed : QueryStatus::Completed)) {
            Logger::debug("Request " + std::to_string(item->id) + " [" + lane_ + "] finished after its caller left; result discarded");
        }
    }
}

} // namespace Arbor
