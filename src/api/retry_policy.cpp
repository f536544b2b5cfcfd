#include "ingest/api/retry_policy.hpp"

#include <spdlog/spdlog.h>

#include <thread>

namespace ingest::api {

void thread_sleep(std::chrono::milliseconds delay) {
    std::this_thread::sleep_for(delay);
}

RetryPolicy RetryPolicy::from_config(const config::Config& config) {
    RetryPolicy policy;
    policy.max_retries = config.max_retries;
    policy.base_delay = config.retry_base_delay;
    return policy;
}

std::chrono::milliseconds RetryPolicy::delay_for(std::size_t attempt) const {
    return base_delay * static_cast<std::chrono::milliseconds::rep>(attempt);
}

void RetryPolicy::wait(std::size_t attempt) const {
    const auto delay = delay_for(attempt);
    spdlog::debug("Backing off {}ms before retry {}/{}", delay.count(), attempt, max_retries);
    if (sleeper) {
        sleeper(delay);
    }
}

bool RetryPolicy::is_retryable_status(int status, network::HttpMethod method) {
    using network::HttpStatus;
    switch (static_cast<HttpStatus>(status)) {
        case HttpStatus::TOO_MANY_REQUESTS:
        case HttpStatus::SERVICE_UNAVAILABLE:
            return true;
        case HttpStatus::BAD_GATEWAY:
        case HttpStatus::GATEWAY_TIMEOUT:
            return network::HttpMethodUtils::is_idempotent(method);
        default:
            return false;
    }
}

bool RetryPolicy::is_fatal_status(int status) {
    return status == static_cast<int>(network::HttpStatus::UNAUTHORIZED) ||
           status == static_cast<int>(network::HttpStatus::FORBIDDEN);
}

bool RetryPolicy::is_retryable(const Error& error, network::HttpMethod method) {
    switch (error.kind) {
        case ErrorKind::ApiError:
            return is_retryable_status(error.status_code, method);
        case ErrorKind::NetworkFailure:
            return network::HttpMethodUtils::is_idempotent(method);
        default:
            return false;
    }
}

} // namespace ingest::api
