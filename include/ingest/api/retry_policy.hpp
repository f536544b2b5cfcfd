/**
 * @file retry_policy.hpp
 * @brief Retry limits, linear backoff and status classification
 *
 * EXAMPLE:
 * RetryPolicy policy = RetryPolicy::from_config(cfg);
 * if (RetryPolicy::is_retryable(error, HttpMethod::POST)) { policy.wait(attempt); }
 */

#pragma once

#include "ingest/config/config.hpp"
#include "ingest/core/error.hpp"
#include "ingest/network/http_types.hpp"

#include <chrono>
#include <cstddef>
#include <functional>

namespace ingest::api {

/// Blocks the calling thread; injectable so tests can record delays.
using Sleeper = std::function<void(std::chrono::milliseconds)>;

void thread_sleep(std::chrono::milliseconds delay);

/**
 * @brief Retry ceiling and linear backoff shared by both retry layers
 *
 * Attempts are counted from 1, so the n-th retry waits base_delay * n.
 * The API client uses it per request, the coordinator per transfer.
 */
struct RetryPolicy {
    std::size_t max_retries = config::Config::kDefaultMaxRetries;
    std::chrono::milliseconds base_delay{500};
    Sleeper sleeper = thread_sleep;

    static RetryPolicy from_config(const config::Config& config);

    [[nodiscard]] std::chrono::milliseconds delay_for(std::size_t attempt) const;

    /// Sleep the backoff for retry number @p attempt.
    void wait(std::size_t attempt) const;

    /// 429/503 for every method, 502/504 only where repeating is safe.
    static bool is_retryable_status(int status, network::HttpMethod method);

    /// 401/403: the session is not allowed, repeating cannot help.
    static bool is_fatal_status(int status);

    /// Per-request classification of a failed exchange.
    static bool is_retryable(const Error& error, network::HttpMethod method);
};

} // namespace ingest::api
