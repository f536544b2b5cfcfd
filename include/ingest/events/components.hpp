/**
 * @file components.hpp
 * @brief Stock subscribers for upload events
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * coordinator.run(request);  // Lifecycle is logged as it happens
 */

#pragma once

#include "ingest/events/event_bus.hpp"
#include "ingest/events/events.hpp"

#include <spdlog/spdlog.h>


namespace ingest::events {

/**
 * @brief Logs every upload event with spdlog
 *
 * Per-part events go to debug so a large transfer does not flood info.
 * Unsubscribes on destruction.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        attempt_id_ = bus_.subscribe<UploadAttemptStartedEvent>([](const UploadAttemptStartedEvent& e) {
            spdlog::info("[AttemptStarted] import={} attempt={} files={}", e.import_id, e.attempt, e.file_count);
        });

        part_id_ = bus_.subscribe<PartUploadedEvent>([](const PartUploadedEvent& e) {
            spdlog::debug("[PartUploaded] import={} path={} part={} bytes={}/{}{}",
                          e.import_id, e.file_path, e.part_number, e.bytes_sent, e.size,
                          e.done ? " done" : "");
        });

        retry_id_ = bus_.subscribe<UploadRetryScheduledEvent>([](const UploadRetryScheduledEvent& e) {
            spdlog::warn("[RetryScheduled] import={} retry={} delay={}ms reason={}",
                         e.import_id, e.attempt, e.delay.count(), e.reason);
        });

        completed_id_ = bus_.subscribe<UploadCompletedEvent>([](const UploadCompletedEvent& e) {
            spdlog::info("[UploadCompleted] import={} attempts={} parts={} duration={}ms",
                         e.import_id, e.attempts, e.parts_sent, e.duration.count());
        });

        failed_id_ = bus_.subscribe<UploadFailedEvent>([](const UploadFailedEvent& e) {
            spdlog::error("[UploadFailed] import={} attempts={} status={} error={}",
                          e.import_id, e.attempts, e.status_code, e.error_message);
        });
    }

    ~LoggerComponent() {
        bus_.unsubscribe(attempt_id_);
        bus_.unsubscribe(part_id_);
        bus_.unsubscribe(retry_id_);
        bus_.unsubscribe(completed_id_);
        bus_.unsubscribe(failed_id_);
    }

    LoggerComponent(const LoggerComponent&) = delete;
    LoggerComponent& operator=(const LoggerComponent&) = delete;

private:
    EventBus& bus_;
    SubscriptionId attempt_id_ = 0;
    SubscriptionId part_id_ = 0;
    SubscriptionId retry_id_ = 0;
    SubscriptionId completed_id_ = 0;
    SubscriptionId failed_id_ = 0;
};

} // namespace ingest::events
