#pragma once

#include "chunkup/core/result.hpp"
#include "chunkup/upload/content_source.hpp"
#include "chunkup/upload/errors.hpp"
#include "chunkup/upload/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace chunkup::upload {

/**
 * @brief Progress state of one file transfer
 *
 * NotStarted -> InProgress -> AwaitingVerification -> Completed, with
 * AwaitingVerification -> InProgress when the server's offset is behind
 * ours, and Failed reachable from any non-terminal state. Every mutation
 * goes through a named transition; an illegal one returns an error and
 * leaves the session untouched.
 *
 * Invariants: 0 <= bytes_written <= file_length, chunk_size > 0, and
 * is_completed() only after a Completed verification followed by a
 * successful completion call.
 *
 * The session references a caller-owned ContentSource which must outlive it.
 */
class UploadSession {
public:
    /// chunk_size must be non-zero; UploadClient checks this before constructing
    UploadSession(UploadTicket ticket, ContentSource& source, std::size_t chunk_size);

    [[nodiscard]] const UploadTicket& ticket() const noexcept { return ticket_; }
    [[nodiscard]] ContentSource& source() const noexcept { return *source_; }
    [[nodiscard]] std::size_t chunk_size() const noexcept { return chunk_size_; }
    [[nodiscard]] std::uint64_t bytes_written() const noexcept { return bytes_written_; }
    [[nodiscard]] std::uint64_t file_length() const noexcept { return file_length_; }
    [[nodiscard]] UploadState state() const noexcept { return state_; }
    [[nodiscard]] bool all_bytes_written() const noexcept { return bytes_written_ == file_length_; }
    [[nodiscard]] bool is_completed() const noexcept { return state_ == UploadState::Completed; }
    [[nodiscard]] bool is_verified_complete() const noexcept { return verified_complete_; }
    [[nodiscard]] bool is_retryable() const noexcept { return retryable_; }
    [[nodiscard]] const std::string& clip_uri() const noexcept { return clip_uri_; }
    [[nodiscard]] const std::string& last_error() const noexcept { return last_error_; }

    /// Ticket acquired, transfer begins. A zero-length file goes straight to verification.
    Result<void> begin();

    /// A chunk was accepted: advance by chunk_size, clamped to file_length
    Result<void> record_chunk_sent();

    /// Server asked for renegotiation before all bytes were believed sent
    Result<void> request_verification();

    /// Adopt the server's offset (must be below file_length) and resume sending from it
    Result<void> reconcile(std::uint64_t server_bytes_written);

    /// Leave verification without new information and keep sending from the current offset
    Result<void> resume_sending();

    Result<void> mark_verified_complete();

    /// Completion call succeeded; requires a prior Completed verification
    Result<void> mark_completed(std::string clip_uri);

    Result<void> mark_failed(std::string error_message, bool retryable = true);

    /// Reopen a retryable failure at the last confirmed offset
    Result<void> resume();

    [[nodiscard]] SessionSnapshot snapshot() const;

    /**
     * @brief Rebuild a session from a snapshot over the same content
     *
     * A started, unfinished snapshot comes back Failed at its confirmed
     * offset, keeping its retryable flag, so resume() continues it. The
     * source must have the snapshot's file length.
     */
    static Result<UploadSession> restore(const SessionSnapshot& snapshot, ContentSource& source);

    [[nodiscard]] std::chrono::system_clock::time_point last_transition() const noexcept {
        return last_transition_;
    }

    /// Time of begin(); epoch while NotStarted
    [[nodiscard]] std::chrono::steady_clock::time_point started_at() const noexcept {
        return started_at_;
    }

private:
    Result<void> transition_to(UploadState next_state);
    [[nodiscard]] bool can_transition(UploadState target) const noexcept;

    UploadTicket ticket_;
    ContentSource* source_;
    std::size_t chunk_size_;
    std::uint64_t file_length_;
    std::uint64_t bytes_written_ = 0;
    UploadState state_ = UploadState::NotStarted;
    bool verified_complete_ = false;
    bool retryable_ = true;
    std::string clip_uri_;
    std::string last_error_;
    std::chrono::system_clock::time_point last_transition_{};
    std::chrono::steady_clock::time_point started_at_{};
};

} // namespace chunkup::upload
