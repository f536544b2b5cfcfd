#include "ingest/upload/progress.hpp"
#include "ingest/events/events.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace ingest::upload {

ProgressUpdate::ProgressUpdate(std::size_t part_number, ImportId import_id,
                               std::filesystem::path file_path,
                               std::uint64_t bytes_sent, std::uint64_t size, bool done)
    : part_number_(part_number),
      import_id_(std::move(import_id)),
      file_path_(std::move(file_path)),
      bytes_sent_(bytes_sent),
      size_(size),
      done_(done) {}

double ProgressUpdate::percent_done() const noexcept {
    // An empty file is sent as one empty part, so bytes cannot tell progress
    if (size_ == 0) {
        return part_number_ == 0 ? 0.0 : 100.0;
    }
    return static_cast<double>(bytes_sent_) / static_cast<double>(size_) * 100.0;
}

void LoggingProgress::on_update(const ProgressUpdate& update) {
    if (update.is_done()) {
        spdlog::info("{}: upload complete ({} bytes)", update.file_path().filename().string(), update.size());
        return;
    }
    spdlog::debug("{}: part {} sent, {:.1f}% ({}/{} bytes)",
                  update.file_path().filename().string(), update.part_number(),
                  update.percent_done(), update.bytes_sent(), update.size());
}

void EventBusProgress::on_update(const ProgressUpdate& update) {
    events::PartUploadedEvent event;
    event.import_id = update.import_id();
    event.file_path = update.file_path().string();
    event.part_number = update.part_number();
    event.bytes_sent = update.bytes_sent();
    event.size = update.size();
    event.done = update.is_done();
    bus_.emit(event);
}

FileProgress::FileProgress(ImportId import_id, std::filesystem::path file_path, std::uint64_t file_size,
                           std::uint64_t parts_already_sent, std::uint64_t bytes_already_sent,
                           std::uint64_t expected_total_parts)
    : import_id_(std::move(import_id)),
      file_path_(std::move(file_path)),
      file_size_(file_size),
      parts_sent_(parts_already_sent),
      bytes_sent_(bytes_already_sent),
      expected_total_parts_(expected_total_parts) {}

ProgressUpdate FileProgress::record_part(std::uint64_t part_bytes) {
    std::lock_guard lock(mutex_);
    ++parts_sent_;
    bytes_sent_ = std::min(bytes_sent_ + part_bytes, file_size_);
    return make_update();
}

ProgressUpdate FileProgress::snapshot() const {
    std::lock_guard lock(mutex_);
    return make_update();
}

bool FileProgress::is_complete() const {
    std::lock_guard lock(mutex_);
    return parts_sent_ >= expected_total_parts_;
}

ProgressUpdate FileProgress::make_update() const {
    return ProgressUpdate(static_cast<std::size_t>(parts_sent_), import_id_, file_path_,
                          bytes_sent_, file_size_, parts_sent_ >= expected_total_parts_);
}

} // namespace ingest::upload
