/**
 * @file coordinator.hpp
 * @brief Resumable upload of a previewed import, with retries and completion
 */

#pragma once

#include "ingest/api/api_client.hpp"
#include "ingest/api/retry_policy.hpp"
#include "ingest/config/config.hpp"
#include "ingest/core/result.hpp"
#include "ingest/events/event_bus.hpp"
#include "ingest/upload/file_upload.hpp"
#include "ingest/upload/progress.hpp"
#include "ingest/upload/transfer_session.hpp"
#include "ingest/upload/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ingest::upload {

struct CompletionRequest {
    std::string dataset_id;
    std::optional<std::string> destination_id;  ///< Target collection, dataset root when absent
    bool append = false;
};

/**
 * @brief Everything one transfer needs; nothing is kept between runs
 */
struct TransferRequest {
    api::RequestContext context;
    ImportId import_id;
    std::vector<TransferFile> files;
    std::optional<CompletionRequest> completion;  ///< Skip completion when absent
};

struct TransferOutcome {
    ImportId import_id;
    std::size_t attempts = 0;     ///< Retries consumed
    std::size_t parts_sent = 0;   ///< Parts accepted during this run
    std::optional<Manifests> manifests;
};

struct CoordinatorOptions {
    std::size_t parallelism = 10;
    std::uint64_t default_chunk_size = config::Config::kDefaultChunkSize;
    api::RetryPolicy retry;

    static CoordinatorOptions from_config(const config::Config& config);
};

/**
 * @brief Drives a transfer to completion across interruptions
 *
 * Each attempt asks the service which parts it is missing, sends only
 * those through a bounded Dispatcher, and optionally completes the import.
 * Any failure along the way is classified: 401/403 and invalid arguments
 * end the transfer at once, everything else backs off (base * attempt) and
 * starts over from the status query until max_retries is used up, after
 * which the result is RetriesExhausted carrying the last error.
 *
 * Usage:
 * ```cpp
 * UploadCoordinator coordinator(client, CoordinatorOptions::from_config(cfg), progress, &bus);
 * auto outcome = coordinator.run(request);
 * ```
 */
class UploadCoordinator {
public:
    UploadCoordinator(api::ApiClient& client, CoordinatorOptions options,
                      ProgressCallback& progress, events::EventBus* bus = nullptr);

    Result<TransferOutcome> run(const TransferRequest& request);

    /// Failures that retrying the whole transfer cannot fix.
    static bool is_terminal_failure(const Error& error);

private:
    Result<void> fetch_status(const TransferRequest& request, TransferSession& session);
    Result<void> send_missing_parts(const TransferRequest& request, TransferSession& session);
    Result<void> complete(const TransferRequest& request, TransferSession& session);
    Result<void> handle_failure(TransferSession& session, Error error);

    static TransferState next_after_status(const TransferRequest& request, const RetrySession& data);

    api::ApiClient& client_;
    CoordinatorOptions options_;
    ProgressCallback& progress_;
    events::EventBus* bus_;
};

} // namespace ingest::upload
