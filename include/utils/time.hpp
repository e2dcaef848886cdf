#pragma once

#include <chrono>

namespace Arbor {

/**
 * @brief Monotonic stopwatch used for stage timings and query ages.
 */
class Timer {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = std::chrono::time_point<Clock>;

    Timer() : start_(Clock::now()) {}
    explicit Timer(TimePoint start) : start_(start) {}

    void reset() {
        start_ = Clock::now();
    }

    TimePoint started_at() const {
        return start_;
    }

    std::chrono::milliseconds elapsed() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start_);
    }

    /**
     * @brief Elapsed milliseconds with sub-millisecond resolution.
     */
    double elapsed_ms() const {
        return std::chrono::duration<double, std::milli>(Clock::now() - start_).count();
    }

    double elapsed_sec() const {
        return elapsed_ms() / 1000.0;
    }

    static std::chrono::milliseconds since(TimePoint start) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
    }

private:
    TimePoint start_;
};

} // namespace Arbor
