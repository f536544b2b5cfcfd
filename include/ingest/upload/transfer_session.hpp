/**
 * @file transfer_session.hpp
 * @brief State machine and retry bookkeeping for one transfer
 */

#pragma once

#include "ingest/core/result.hpp"
#include "ingest/upload/file_upload.hpp"
#include "ingest/upload/types.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <vector>

namespace ingest::upload {

enum class TransferState {
    Idle,
    FetchingStatus,
    Sending,
    Completing,
    Backoff,
    Completed,
    Failed
};

const char* to_string(TransferState state);

/**
 * @brief Mutable state of one coordinator invocation
 *
 * Owned by a single coordinator call and discarded when it returns.
 */
struct RetrySession {
    ImportId import_id;
    std::vector<TransferFile> files;
    std::optional<FilesMissingParts> missing_parts;  ///< Latest status snapshot
    std::size_t attempt = 0;                         ///< Retries consumed so far
    std::optional<Error> last_error;
    std::size_t parts_sent = 0;
    bool parts_settled = false;                      ///< A send pass finished without error
    std::optional<Manifests> manifests;
};

/**
 * @brief The whole-transfer state machine
 *
 * Idle -> FetchingStatus -> Sending -> [Completing ->] Completed, with
 * FetchingStatus, Sending and Completing able to fall into Backoff, which
 * only leads back to FetchingStatus. Once every part has been sent, a
 * retry goes FetchingStatus -> Completing without resending. Failed is
 * reachable from anywhere.
 * Completed and Failed are terminal.
 */
class TransferSession {
public:
    TransferSession(ImportId import_id, std::vector<TransferFile> files);

    [[nodiscard]] TransferState state() const noexcept { return state_; }
    [[nodiscard]] bool is_terminal() const noexcept {
        return state_ == TransferState::Completed || state_ == TransferState::Failed;
    }

    [[nodiscard]] RetrySession& data() noexcept { return data_; }
    [[nodiscard]] const RetrySession& data() const noexcept { return data_; }

    Result<void> start();
    Result<void> transition_to(TransferState next_state);
    Result<void> mark_failed(Error error);

    /// Record a failure and move to Backoff, consuming one retry.
    Result<void> schedule_retry(Error error);

    [[nodiscard]] std::chrono::steady_clock::duration elapsed() const;

private:
    [[nodiscard]] bool can_transition(TransferState target) const noexcept;

    TransferState state_ = TransferState::Idle;
    RetrySession data_;
    std::chrono::steady_clock::time_point started_at_{};
};

} // namespace ingest::upload
