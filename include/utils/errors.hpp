/**
 * @file errors.hpp
 * @brief Exception taxonomy shared by the batch pipeline and the request path
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace Arbor {

using RequestId = std::uint64_t;

/**
 * @brief Input data violates a structural assumption (dangling endpoint, self-loop, bad row).
 */
class DataIntegrityError : public std::runtime_error {
public:
    explicit DataIntegrityError(const std::string& what)
        : std::runtime_error("Data integrity: " + what) {}
};

/**
 * @brief The tree edge set could not be made acyclic. Fatal for the batch job.
 */
class DecompositionInvariantError : public std::runtime_error {
public:
    explicit DecompositionInvariantError(const std::string& what)
        : std::runtime_error("Decomposition invariant violated: " + what) {}
};

/**
 * @brief A feedback-arc-set heuristic cannot run on this input; the solver falls back.
 */
class StrategyUnavailableError : public std::runtime_error {
public:
    explicit StrategyUnavailableError(const std::string& what)
        : std::runtime_error(what) {}
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what)
        : std::runtime_error("Configuration: " + what) {}
};

/**
 * @brief The caller stopped waiting for a submitted query. Retryable.
 */
class QueryTimeoutError : public std::runtime_error {
public:
    QueryTimeoutError(RequestId id, std::chrono::milliseconds timeout)
        : std::runtime_error("Query " + std::to_string(id) + " timed out after " +
                             std::to_string(timeout.count()) + "ms"),
          request_id_(id), timeout_(timeout) {}

    RequestId request_id() const noexcept { return request_id_; }
    std::chrono::milliseconds timeout() const noexcept { return timeout_; }

private:
    RequestId request_id_;
    std::chrono::milliseconds timeout_;
};

/**
 * @brief The query was cancelled before it produced a result.
 */
class QueryCancelledError : public std::runtime_error {
public:
    explicit QueryCancelledError(RequestId id)
        : std::runtime_error("Query " + std::to_string(id) + " cancelled"), request_id_(id) {}

    RequestId request_id() const noexcept { return request_id_; }

private:
    RequestId request_id_;
};

} // namespace Arbor
