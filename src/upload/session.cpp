#include "chunkup/upload/session.hpp"

#include <algorithm>
#include <string>
#include <unordered_map>
#include <vector>

namespace chunkup::upload {
namespace {

bool is_progressive(UploadState current, UploadState target) {
    static const std::unordered_map<UploadState, std::vector<UploadState>> transitions {
        {UploadState::NotStarted, {UploadState::InProgress}},
        {UploadState::InProgress, {UploadState::AwaitingVerification}},
        {UploadState::AwaitingVerification, {UploadState::InProgress, UploadState::Completed}},
    };

    if (target == UploadState::Failed) {
        return true;
    }

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed_list = it->second;
    return std::find(allowed_list.begin(), allowed_list.end(), target) != allowed_list.end();
}

std::string illegal(const char* operation, UploadState state) {
    return std::string(operation) + " is not allowed in state " + to_string(state);
}

} // namespace

UploadSession::UploadSession(UploadTicket ticket, ContentSource& source, std::size_t chunk_size)
    : ticket_(std::move(ticket))
    , source_(&source)
    , chunk_size_(chunk_size)
    , file_length_(source.length()) {
    last_transition_ = std::chrono::system_clock::now();
}

Result<void> UploadSession::begin() {
    if (state_ != UploadState::NotStarted) {
        return Err("Session already started");
    }
    if (auto res = transition_to(UploadState::InProgress); res.is_error()) {
        return res;
    }
    started_at_ = std::chrono::steady_clock::now();
    if (file_length_ == 0) {
        return transition_to(UploadState::AwaitingVerification);
    }
    return Ok();
}

Result<void> UploadSession::record_chunk_sent() {
    if (state_ != UploadState::InProgress) {
        return Err(illegal("record_chunk_sent", state_));
    }
    const std::uint64_t remaining = file_length_ - bytes_written_;
    bytes_written_ = chunk_size_ >= remaining ? file_length_ : bytes_written_ + chunk_size_;
    if (all_bytes_written()) {
        return transition_to(UploadState::AwaitingVerification);
    }
    return Ok();
}

Result<void> UploadSession::request_verification() {
    if (state_ != UploadState::InProgress) {
        return Err(illegal("request_verification", state_));
    }
    return transition_to(UploadState::AwaitingVerification);
}

Result<void> UploadSession::reconcile(std::uint64_t server_bytes_written) {
    if (state_ != UploadState::InProgress && state_ != UploadState::AwaitingVerification) {
        return Err(illegal("reconcile", state_));
    }
    if (server_bytes_written >= file_length_) {
        return Err("Cannot reconcile to " + std::to_string(server_bytes_written) +
                   " bytes: file length is " + std::to_string(file_length_));
    }
    if (auto res = transition_to(UploadState::InProgress); res.is_error()) {
        return res;
    }
    bytes_written_ = server_bytes_written;
    verified_complete_ = false;
    return Ok();
}

Result<void> UploadSession::resume_sending() {
    if (state_ != UploadState::AwaitingVerification) {
        return Err(illegal("resume_sending", state_));
    }
    if (all_bytes_written()) {
        return Err("All bytes already written; nothing left to send");
    }
    return transition_to(UploadState::InProgress);
}

Result<void> UploadSession::mark_verified_complete() {
    if (state_ != UploadState::AwaitingVerification) {
        return Err(illegal("mark_verified_complete", state_));
    }
    bytes_written_ = file_length_;
    verified_complete_ = true;
    return Ok();
}

Result<void> UploadSession::mark_completed(std::string clip_uri) {
    if (!verified_complete_) {
        return Err("Upload has not been verified as complete");
    }
    if (auto res = transition_to(UploadState::Completed); res.is_error()) {
        return res;
    }
    clip_uri_ = std::move(clip_uri);
    return Ok();
}

Result<void> UploadSession::mark_failed(std::string error_message, bool retryable) {
    if (auto res = transition_to(UploadState::Failed); res.is_error()) {
        return res;
    }
    last_error_ = std::move(error_message);
    retryable_ = retryable;
    return Ok();
}

Result<void> UploadSession::resume() {
    if (state_ != UploadState::Failed) {
        return Err(illegal("resume", state_));
    }
    if (!retryable_) {
        return Err("Session failed permanently: " + last_error_);
    }
    // Bypasses the table: Failed is terminal for ordinary transitions
    state_ = all_bytes_written() ? UploadState::AwaitingVerification : UploadState::InProgress;
    verified_complete_ = false;
    last_error_.clear();
    last_transition_ = std::chrono::system_clock::now();
    return Ok();
}

SessionSnapshot UploadSession::snapshot() const {
    SessionSnapshot snapshot;
    snapshot.ticket_id = ticket_.ticket_id;
    snapshot.state = state_;
    snapshot.bytes_written = bytes_written_;
    snapshot.file_length = file_length_;
    snapshot.clip_uri = clip_uri_;
    snapshot.ticket = ticket_;
    snapshot.chunk_size = chunk_size_;
    snapshot.retryable = retryable_;
    return snapshot;
}

Result<UploadSession> UploadSession::restore(const SessionSnapshot& snapshot, ContentSource& source) {
    if (snapshot.chunk_size == 0) {
        return Err("Snapshot has no chunk size");
    }
    if (source.length() != snapshot.file_length) {
        return Err("Source length " + std::to_string(source.length()) +
                   " does not match snapshot length " + std::to_string(snapshot.file_length));
    }
    if (snapshot.bytes_written > snapshot.file_length) {
        return Err("Snapshot offset " + std::to_string(snapshot.bytes_written) +
                   " is past the file length " + std::to_string(snapshot.file_length));
    }

    UploadSession session(snapshot.ticket, source, snapshot.chunk_size);
    if (snapshot.state == UploadState::NotStarted) {
        return Ok(std::move(session));
    }

    session.bytes_written_ = snapshot.bytes_written;
    session.retryable_ = snapshot.retryable;
    session.started_at_ = std::chrono::steady_clock::now();
    if (snapshot.state == UploadState::Completed) {
        session.state_ = UploadState::Completed;
        session.verified_complete_ = true;
        session.clip_uri_ = snapshot.clip_uri;
    } else {
        session.state_ = UploadState::Failed;
        session.last_error_ = "Restored from snapshot";
    }
    return Ok(std::move(session));
}

Result<void> UploadSession::transition_to(UploadState next_state) {
    if (state_ == next_state) {
        return Ok();
    }

    if (!can_transition(next_state)) {
        return Err(std::string("Illegal session state transition ") + to_string(state_) +
                   " -> " + to_string(next_state));
    }

    state_ = next_state;
    last_transition_ = std::chrono::system_clock::now();
    return Ok();
}

bool UploadSession::can_transition(UploadState target) const noexcept {
    if (state_ == target) {
        return true;
    }

    if (state_ == UploadState::Failed || state_ == UploadState::Completed) {
        return false;
    }

    return is_progressive(state_, target);
}

} // namespace chunkup::upload
