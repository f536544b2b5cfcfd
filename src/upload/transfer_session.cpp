#include "ingest/upload/transfer_session.hpp"

#include <algorithm>
#include <string>
#include <unordered_map>
#include <vector>

namespace ingest::upload {
namespace {

bool is_progressive(TransferState current, TransferState target) {
    static const std::unordered_map<TransferState, std::vector<TransferState>> transitions {
        {TransferState::Idle, {TransferState::FetchingStatus}},
        {TransferState::FetchingStatus, {TransferState::Sending, TransferState::Completing, TransferState::Backoff}},
        {TransferState::Sending, {TransferState::Completing, TransferState::Completed, TransferState::Backoff}},
        {TransferState::Completing, {TransferState::Completed, TransferState::Backoff}},
        {TransferState::Backoff, {TransferState::FetchingStatus}},
    };

    if (target == TransferState::Failed) {
        return true;
    }

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed_list = it->second;
    return std::find(allowed_list.begin(), allowed_list.end(), target) != allowed_list.end();
}

} // namespace

const char* to_string(TransferState state) {
    switch (state) {
        case TransferState::Idle: return "idle";
        case TransferState::FetchingStatus: return "fetching-status";
        case TransferState::Sending: return "sending";
        case TransferState::Completing: return "completing";
        case TransferState::Backoff: return "backoff";
        case TransferState::Completed: return "completed";
        case TransferState::Failed: return "failed";
    }
    return "unknown";
}

TransferSession::TransferSession(ImportId import_id, std::vector<TransferFile> files) {
    data_.import_id = std::move(import_id);
    data_.files = std::move(files);
}

Result<void> TransferSession::start() {
    if (state_ != TransferState::Idle) {
        return Err<void>(Error::invalid_argument("Transfer already started"));
    }
    started_at_ = std::chrono::steady_clock::now();
    return transition_to(TransferState::FetchingStatus);
}

Result<void> TransferSession::transition_to(TransferState next_state) {
    if (!can_transition(next_state)) {
        return Err<void>(Error::invalid_argument(std::string("Illegal transfer state transition: ") +
                                                 to_string(state_) + " -> " + to_string(next_state)));
    }
    state_ = next_state;
    return Ok();
}

Result<void> TransferSession::mark_failed(Error error) {
    data_.last_error = std::move(error);
    return transition_to(TransferState::Failed);
}

Result<void> TransferSession::schedule_retry(Error error) {
    auto moved = transition_to(TransferState::Backoff);
    if (moved.is_error()) {
        return moved;
    }
    data_.last_error = std::move(error);
    ++data_.attempt;
    return Ok();
}

std::chrono::steady_clock::duration TransferSession::elapsed() const {
    return std::chrono::steady_clock::now() - started_at_;
}

bool TransferSession::can_transition(TransferState target) const noexcept {
    if (state_ == TransferState::Completed || state_ == TransferState::Failed) {
        return target == state_;
    }
    return is_progressive(state_, target);
}

} // namespace ingest::upload
