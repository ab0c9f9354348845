#include "relay/transfer/session.hpp"

#include <algorithm>
#include <unordered_map>
#include <vector>

namespace relay::transfer {
namespace {

bool is_progressive(TransferState current, TransferState target) {
    static const std::unordered_map<TransferState, std::vector<TransferState>> transitions {
        {TransferState::Idle, {TransferState::Staging}},
        {TransferState::Staging, {TransferState::Downloading}},
        {TransferState::Downloading, {TransferState::Uploading}},
        {TransferState::Uploading, {TransferState::Finalizing}},
        {TransferState::Finalizing, {TransferState::Completed}},
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

const char* to_string(TransferState state) noexcept {
    switch (state) {
        case TransferState::Idle: return "idle";
        case TransferState::Staging: return "staging";
        case TransferState::Downloading: return "downloading";
        case TransferState::Uploading: return "uploading";
        case TransferState::Finalizing: return "finalizing";
        case TransferState::Completed: return "completed";
        case TransferState::Failed: return "failed";
    }
    return "unknown";
}

const char* to_string(Phase phase) noexcept {
    switch (phase) {
        case Phase::Downloading: return "downloading";
        case Phase::Uploading: return "uploading";
        case Phase::Finalizing: return "finalizing";
    }
    return "unknown";
}

TransferSession::TransferSession(std::string transfer_id, std::string name) {
    info_.transfer_id = std::move(transfer_id);
    info_.name = std::move(name);
    info_.state = TransferState::Idle;
    last_transition_ = std::chrono::system_clock::now();
}

relay::Result<void> TransferSession::start() {
    if (info_.state != TransferState::Idle) {
        return relay::Err(std::string("Transfer already started"));
    }
    info_.started_at = std::chrono::system_clock::now();
    return transition_to(TransferState::Staging);
}

relay::Result<void> TransferSession::transition_to(TransferState next_state) {
    if (info_.state == next_state) {
        return relay::Ok();
    }

    if (!can_transition(next_state)) {
        return relay::Err(std::string("Illegal transfer state transition from ") + to_string(info_.state) +
                          " to " + to_string(next_state));
    }

    info_.state = next_state;
    last_transition_ = std::chrono::system_clock::now();
    if (next_state != TransferState::Failed) {
        info_.last_error.clear();
    }
    return relay::Ok();
}

relay::Result<void> TransferSession::mark_failed(std::string error_message) {
    if (info_.state == TransferState::Completed) {
        return relay::Err(std::string("Transfer already completed"));
    }
    info_.last_error = std::move(error_message);
    return transition_to(TransferState::Failed);
}

void TransferSession::update_bytes(std::uint64_t staged, std::uint64_t confirmed) {
    info_.bytes_staged = staged;
    info_.bytes_confirmed = confirmed;
}

bool TransferSession::can_transition(TransferState target) const noexcept {
    if (info_.state == target) {
        return true;
    }

    if (info_.state == TransferState::Failed || info_.state == TransferState::Completed) {
        return false;
    }

    return is_progressive(info_.state, target);
}

} // namespace relay::transfer
