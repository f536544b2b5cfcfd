#include "ingest/core/error.hpp"

namespace ingest {

Error Error::io_failure(std::string message) {
    return Error{ErrorKind::IoFailure, 0, std::move(message)};
}

Error Error::network_failure(std::string message) {
    return Error{ErrorKind::NetworkFailure, 0, std::move(message)};
}

Error Error::api_error(int status_code, std::string message) {
    return Error{ErrorKind::ApiError, status_code, std::move(message)};
}

Error Error::upload_rejected(std::string message) {
    return Error{ErrorKind::UploadRejected, 0, std::move(message)};
}

Error Error::retries_exhausted(const Error& last) {
    return Error{ErrorKind::RetriesExhausted, last.status_code, last.describe()};
}

Error Error::invalid_argument(std::string message) {
    return Error{ErrorKind::InvalidArgument, 0, std::move(message)};
}

Error Error::parse_failure(std::string message) {
    return Error{ErrorKind::ParseFailure, 0, std::move(message)};
}

std::string Error::describe() const {
    std::string text = to_string(kind);
    text += ": ";
    if (has_status()) {
        text += std::to_string(status_code);
        text += " ";
    }
    text += message;
    return text;
}

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::IoFailure: return "io error";
        case ErrorKind::NetworkFailure: return "network error";
        case ErrorKind::ApiError: return "api error";
        case ErrorKind::UploadRejected: return "upload error";
        case ErrorKind::RetriesExhausted: return "retries exhausted";
        case ErrorKind::InvalidArgument: return "invalid argument";
        case ErrorKind::ParseFailure: return "parse error";
    }
    return "unknown error";
}

} // namespace ingest
