#pragma once

#include <string>

namespace ingest {

/**
 * @brief Failure categories surfaced by the upload engine
 *
 * The category decides who may absorb the failure: NetworkFailure and
 * retryable ApiErrors are absorbed per request by the API client,
 * UploadRejected and IoFailure only by the transfer coordinator.
 */
enum class ErrorKind {
    IoFailure,          // Local file could not be opened, sought or read
    NetworkFailure,     // Connection, TLS, or timeout at the transport
    ApiError,           // Server answered with a 4xx/5xx status
    UploadRejected,     // Chunk endpoint answered success=false
    RetriesExhausted,   // Retry ceiling reached, wraps the last failure
    InvalidArgument,    // Caller supplied something that cannot work
    ParseFailure        // Response body did not match the expected shape
};

struct Error {
    ErrorKind kind = ErrorKind::InvalidArgument;
    int status_code = 0;   ///< HTTP status when one applies, 0 otherwise
    std::string message;

    static Error io_failure(std::string message);
    static Error network_failure(std::string message);
    static Error api_error(int status_code, std::string message);
    static Error upload_rejected(std::string message);
    static Error retries_exhausted(const Error& last);
    static Error invalid_argument(std::string message);
    static Error parse_failure(std::string message);

    [[nodiscard]] bool has_status() const noexcept { return status_code != 0; }

    /// "api error: 503 Service Unavailable" style rendering for logs.
    [[nodiscard]] std::string describe() const;
};

const char* to_string(ErrorKind kind);

} // namespace ingest
