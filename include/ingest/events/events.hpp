/**
 * @file events.hpp
 * @brief Events emitted over the life of one transfer
 *
 * NAMING CONVENTION:
 * Events are past-tense: PartUploadedEvent, UploadFailedEvent
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace ingest::events {

/**
 * @brief A coordinator attempt is about to query status and send parts
 *
 * WHO EMITS: UploadCoordinator, once per attempt (attempt 0 is the first)
 */
struct UploadAttemptStartedEvent {
    std::string import_id;
    std::size_t attempt = 0;
    std::size_t file_count = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief The service accepted one part
 *
 * WHO EMITS: EventBusProgress, from the dispatcher worker that sent it
 */
struct PartUploadedEvent {
    std::string import_id;
    std::string file_path;
    std::size_t part_number = 0;   // Parts acknowledged so far for this file
    std::uint64_t bytes_sent = 0;
    std::uint64_t size = 0;
    bool done = false;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct UploadRetryScheduledEvent {
    std::string import_id;
    std::size_t attempt = 0;       // Retry number, counted from 1
    std::chrono::milliseconds delay{0};
    std::string reason;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct UploadCompletedEvent {
    std::string import_id;
    std::size_t attempts = 0;
    std::size_t parts_sent = 0;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct UploadFailedEvent {
    std::string import_id;
    std::size_t attempts = 0;
    int status_code = 0;
    std::string error_message;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

} // namespace ingest::events
