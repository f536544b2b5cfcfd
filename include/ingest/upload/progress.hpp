/**
 * @file progress.hpp
 * @brief Per-file progress tracking and the callbacks that receive it
 */

#pragma once

#include "ingest/events/event_bus.hpp"
#include "ingest/upload/types.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>

namespace ingest::upload {

/**
 * @brief Snapshot of one file's progress after a part was accepted
 */
class ProgressUpdate {
public:
    ProgressUpdate(std::size_t part_number, ImportId import_id, std::filesystem::path file_path,
                   std::uint64_t bytes_sent, std::uint64_t size, bool done);

    /// Parts of this file the service holds, including earlier attempts.
    std::size_t part_number() const noexcept { return part_number_; }
    const ImportId& import_id() const noexcept { return import_id_; }
    const std::filesystem::path& file_path() const noexcept { return file_path_; }
    std::uint64_t bytes_sent() const noexcept { return bytes_sent_; }
    std::uint64_t size() const noexcept { return size_; }
    bool is_done() const noexcept { return done_; }

    /// For an empty file: 0 before its single part, 100 after.
    double percent_done() const noexcept;

private:
    std::size_t part_number_;
    ImportId import_id_;
    std::filesystem::path file_path_;
    std::uint64_t bytes_sent_;
    std::uint64_t size_;
    bool done_;
};

/**
 * @brief Receives one update per accepted part
 *
 * Called from dispatcher worker threads, possibly concurrently.
 * Fire-and-forget: the transfer does not wait on or inspect the callback.
 */
class ProgressCallback {
public:
    virtual ~ProgressCallback() = default;
    virtual void on_update(const ProgressUpdate& update) = 0;
};

class NoProgress : public ProgressCallback {
public:
    void on_update(const ProgressUpdate&) override {}
};

/// Logs each update at debug, and completed files at info.
class LoggingProgress : public ProgressCallback {
public:
    void on_update(const ProgressUpdate& update) override;
};

/// Republishes updates as PartUploadedEvent.
class EventBusProgress : public ProgressCallback {
public:
    explicit EventBusProgress(events::EventBus& bus) : bus_(bus) {}

    void on_update(const ProgressUpdate& update) override;

private:
    events::EventBus& bus_;
};

/**
 * @brief Per-file acknowledgement counter
 *
 * Seeded from what the server already holds; record_part() is called once
 * per accepted part, from any worker. Because counting happens here rather
 * than when chunks are read, updates are monotonic and exactly the update
 * for the last outstanding part is marked done.
 */
class FileProgress {
public:
    FileProgress(ImportId import_id, std::filesystem::path file_path, std::uint64_t file_size,
                 std::uint64_t parts_already_sent, std::uint64_t bytes_already_sent,
                 std::uint64_t expected_total_parts);

    ProgressUpdate record_part(std::uint64_t part_bytes);

    /// Current state without recording anything.
    ProgressUpdate snapshot() const;

    bool is_complete() const;

private:
    ProgressUpdate make_update() const;

    mutable std::mutex mutex_;
    ImportId import_id_;
    std::filesystem::path file_path_;
    std::uint64_t file_size_;
    std::uint64_t parts_sent_;
    std::uint64_t bytes_sent_;
    std::uint64_t expected_total_parts_;
};

} // namespace ingest::upload
