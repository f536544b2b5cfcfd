#include "ingest/upload/coordinator.hpp"
#include "ingest/events/events.hpp"
#include "ingest/upload/chunk_source.hpp"
#include "ingest/upload/dispatcher.hpp"
#include "ingest/upload/missing_parts.hpp"
#include "ingest/upload/part_sender.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <memory>
#include <system_error>

namespace ingest::upload {

namespace {

/// Per-file state for one sending pass.
struct FileState {
    FileState(PartDestination dest, ChunkSource src, std::unique_ptr<FileProgress> progress)
        : destination(std::move(dest)),
          source(std::move(src)),
          tracker(std::move(progress)) {}

    PartDestination destination;
    ChunkSource source;
    std::unique_ptr<FileProgress> tracker;
};

Result<std::unique_ptr<FileState>> open_file(const TransferFile& file,
                                             const FilesMissingParts* report,
                                             const ImportId& import_id,
                                             std::uint64_t default_chunk_size) {
    const RemoteFile& remote = file.remote;

    const std::uint64_t chunk_size = remote.effective_chunk_size(default_chunk_size);
    if (remote.chunked_upload && remote.chunked_upload->chunk_size > 0) {
        spdlog::debug("{}: chunk size received from the upload service: {}", remote.file_name, chunk_size);
    } else {
        spdlog::debug("{}: no chunk size received from the upload service, using {}",
                      remote.file_name, chunk_size);
    }

    std::error_code ec;
    const auto file_size = static_cast<std::uint64_t>(std::filesystem::file_size(file.local_path, ec));
    if (ec) {
        return Err<std::unique_ptr<FileState>>(Error::io_failure(
            "Cannot stat " + file.local_path.string() + ": " + ec.message()));
    }

    std::optional<FileMissingParts> missing;
    if (report) {
        if (const auto* entry = report->find(remote.file_name)) {
            missing = *entry;
        }
    }

    auto plan = reconcile(missing, chunk_size, file_size);
    if (plan.is_error()) {
        return Err<std::unique_ptr<FileState>>(plan.error());
    }
    if (missing) {
        spdlog::debug("{}: resuming with {}/{} parts already sent", remote.file_name,
                      plan.value().parts_already_sent, plan.value().expected_total_parts);
    }

    auto source = ChunkSource::open(file.local_path, chunk_size, file_size, plan.value().parts_to_send);
    if (source.is_error()) {
        return Err<std::unique_ptr<FileState>>(source.error());
    }

    auto tracker = std::make_unique<FileProgress>(import_id, file.local_path, file_size,
                                                  plan.value().parts_already_sent,
                                                  plan.value().bytes_already_sent,
                                                  plan.value().expected_total_parts);

    PartDestination destination{import_id, remote.file_name, remote.multipart_upload_id};
    return Ok(std::make_unique<FileState>(std::move(destination), std::move(source.value()), std::move(tracker)));
}

} // namespace

CoordinatorOptions CoordinatorOptions::from_config(const config::Config& config) {
    CoordinatorOptions options;
    options.parallelism = config.parallelism;
    options.default_chunk_size = config.default_chunk_size;
    options.retry = api::RetryPolicy::from_config(config);
    return options;
}

UploadCoordinator::UploadCoordinator(api::ApiClient& client, CoordinatorOptions options,
                                     ProgressCallback& progress, events::EventBus* bus)
    : client_(client),
      options_(std::move(options)),
      progress_(progress),
      bus_(bus) {}

bool UploadCoordinator::is_terminal_failure(const Error& error) {
    if (error.kind == ErrorKind::InvalidArgument) {
        return true;
    }
    return error.kind == ErrorKind::ApiError && api::RetryPolicy::is_fatal_status(error.status_code);
}

TransferState UploadCoordinator::next_after_status(const TransferRequest& request, const RetrySession& data) {
    // Parts already went through on an earlier attempt; only resend what the
    // service still reports missing.
    const bool nothing_reported = !data.missing_parts || data.missing_parts->files.empty();
    if (data.parts_settled && request.completion && nothing_reported) {
        return TransferState::Completing;
    }
    return TransferState::Sending;
}

Result<TransferOutcome> UploadCoordinator::run(const TransferRequest& request) {
    if (options_.parallelism == 0) {
        return Err<TransferOutcome>(Error::invalid_argument("parallelism must be > 0"));
    }
    if (options_.default_chunk_size == 0) {
        return Err<TransferOutcome>(Error::invalid_argument("default chunk size must be > 0"));
    }

    TransferSession session(request.import_id, request.files);
    if (auto started = session.start(); started.is_error()) {
        return Err<TransferOutcome>(started.error());
    }

    while (!session.is_terminal()) {
        Result<void> step = Ok();

        switch (session.state()) {
            case TransferState::FetchingStatus:
                if (bus_) {
                    bus_->emit(events::UploadAttemptStartedEvent{
                        request.import_id, session.data().attempt, request.files.size()});
                }
                step = fetch_status(request, session);
                if (step.is_ok()) {
                    step = session.transition_to(next_after_status(request, session.data()));
                }
                break;

            case TransferState::Sending:
                step = send_missing_parts(request, session);
                if (step.is_ok()) {
                    session.data().parts_settled = true;
                    step = session.transition_to(request.completion ? TransferState::Completing
                                                                    : TransferState::Completed);
                }
                break;

            case TransferState::Completing:
                step = complete(request, session);
                if (step.is_ok()) {
                    step = session.transition_to(TransferState::Completed);
                }
                break;

            case TransferState::Backoff:
                options_.retry.wait(session.data().attempt);
                step = session.transition_to(TransferState::FetchingStatus);
                break;

            default:
                step = Err<void>(Error::invalid_argument(std::string("Unexpected transfer state: ") +
                                                         to_string(session.state())));
                break;
        }

        if (step.is_error()) {
            auto handled = handle_failure(session, step.error());
            if (handled.is_error()) {
                return Err<TransferOutcome>(handled.error());
            }
        }
    }

    const auto& data = session.data();
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(session.elapsed());

    if (session.state() == TransferState::Failed) {
        const Error error = data.last_error.value_or(Error::invalid_argument("transfer failed"));
        if (bus_) {
            bus_->emit(events::UploadFailedEvent{
                request.import_id, data.attempt, error.status_code, error.describe()});
        }
        return Err<TransferOutcome>(error);
    }

    if (bus_) {
        bus_->emit(events::UploadCompletedEvent{request.import_id, data.attempt, data.parts_sent, elapsed});
    }

    TransferOutcome outcome;
    outcome.import_id = request.import_id;
    outcome.attempts = data.attempt;
    outcome.parts_sent = data.parts_sent;
    outcome.manifests = data.manifests;
    return Ok(std::move(outcome));
}

Result<void> UploadCoordinator::fetch_status(const TransferRequest& request, TransferSession& session) {
    auto status = client_.get_upload_status(request.context, request.import_id);
    if (status.is_error()) {
        return Err<void>(status.error());
    }
    session.data().missing_parts = std::move(status.value());
    return Ok();
}

Result<void> UploadCoordinator::send_missing_parts(const TransferRequest& request, TransferSession& session) {
    const auto& missing = session.data().missing_parts;
    const FilesMissingParts* report = missing ? &*missing : nullptr;

    // With a report, only the files it names still need anything
    std::vector<const TransferFile*> selected;
    for (const auto& file : session.data().files) {
        if (!report || report->find(file.remote.file_name)) {
            selected.push_back(&file);
        }
    }

    PartSender sender(client_, request.context, progress_);
    std::vector<std::unique_ptr<FileState>> states;
    std::size_t current = 0;
    std::atomic<std::size_t> accepted{0};

    auto next_job = [&]() -> Result<std::optional<Dispatcher::Job>> {
        while (current < selected.size()) {
            if (states.size() <= current) {
                auto opened = open_file(*selected[current], report, request.import_id,
                                        options_.default_chunk_size);
                if (opened.is_error()) {
                    return Err<std::optional<Dispatcher::Job>>(opened.error());
                }
                states.push_back(std::move(opened.value()));
            }

            FileState* state = states[current].get();
            auto chunk = state->source.next();
            if (chunk.is_error()) {
                return Err<std::optional<Dispatcher::Job>>(chunk.error());
            }
            if (!chunk.value()) {
                ++current;
                continue;
            }

            auto part = std::make_shared<FileChunk>(std::move(*chunk.value()));
            Dispatcher::Job job = [&sender, &accepted, state, part]() -> Result<void> {
                auto sent = sender.send(*part, state->destination, *state->tracker);
                if (sent.is_ok()) {
                    ++accepted;
                }
                return sent;
            };
            return Ok(std::optional<Dispatcher::Job>{std::move(job)});
        }
        return Ok(std::optional<Dispatcher::Job>{});
    };

    auto result = Dispatcher(options_.parallelism).run(next_job);
    session.data().parts_sent += accepted.load();
    return result;
}

Result<void> UploadCoordinator::complete(const TransferRequest& request, TransferSession& session) {
    const CompletionRequest& completion = *request.completion;
    auto manifests = client_.complete_upload(request.context, request.import_id, completion.dataset_id,
                                             completion.destination_id, completion.append);
    if (manifests.is_error()) {
        return Err<void>(manifests.error());
    }
    session.data().manifests = std::move(manifests.value());
    return Ok();
}

Result<void> UploadCoordinator::handle_failure(TransferSession& session, Error error) {
    const auto& data = session.data();

    if (is_terminal_failure(error)) {
        spdlog::error("Upload {} failed: {}", data.import_id, error.describe());
        return session.mark_failed(std::move(error));
    }

    if (data.attempt < options_.retry.max_retries) {
        const std::string reason = error.describe();
        auto scheduled = session.schedule_retry(std::move(error));
        if (scheduled.is_error()) {
            return scheduled;
        }
        const auto delay = options_.retry.delay_for(data.attempt);
        spdlog::warn("Upload {} attempt failed ({}), retry {}/{} in {}ms",
                     data.import_id, reason, data.attempt, options_.retry.max_retries, delay.count());
        if (bus_) {
            bus_->emit(events::UploadRetryScheduledEvent{data.import_id, data.attempt, delay, reason});
        }
        return Ok();
    }

    spdlog::error("Upload {} giving up after {} retries: {}",
                  data.import_id, data.attempt, error.describe());
    return session.mark_failed(Error::retries_exhausted(error));
}

} // namespace ingest::upload
