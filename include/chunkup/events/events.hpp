/**
 * @file events.hpp
 * @brief Upload lifecycle events
 *
 * NAMING CONVENTION:
 * Events are past-tense: ChunkSentEvent, OffsetReconciledEvent.
 *
 * All events are emitted by UploadClient on the thread running the upload.
 */

#pragma once

#include "chunkup/upload/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace chunkup::events {

/**
 * @brief A session has been created for a new ticket
 */
struct UploadStartedEvent {
    std::string ticket_id;
    std::uint64_t file_length = 0;
    std::size_t chunk_size = 0;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
};

/**
 * @brief The server accepted one chunk
 *
 * bytes_written is the session offset after the chunk was recorded.
 */
struct ChunkSentEvent {
    std::string ticket_id;
    std::uint64_t range_start = 0;
    std::uint64_t range_end = 0;
    std::uint64_t bytes_written = 0;
    std::uint64_t file_length = 0;
};

/**
 * @brief The client's offset was replaced by the server's
 *
 * WHO SUBSCRIBES:
 * - Logger (warn: bytes will be resent)
 * - Progress tracking (progress can move backwards)
 */
struct OffsetReconciledEvent {
    std::string ticket_id;
    std::uint64_t client_bytes_written = 0;
    std::uint64_t server_bytes_written = 0;
    std::uint64_t file_length = 0;
};

struct UploadVerifiedEvent {
    std::string ticket_id;
    upload::VerificationStatus status = upload::VerificationStatus::InProgress;
    bool offset_reported = false;
    std::uint64_t bytes_written = 0;
    std::uint64_t file_length = 0;
};

struct UploadCompletedEvent {
    std::string ticket_id;
    std::string clip_uri;
    std::uint64_t file_length = 0;
    std::chrono::milliseconds duration{0};
};

/**
 * @brief The upload loop stopped on an error
 *
 * retryable tells whether the same session can be resumed.
 */
struct UploadFailedEvent {
    std::string ticket_id;
    std::string error_message;
    std::uint64_t bytes_written = 0;
    bool retryable = true;
};

} // namespace chunkup::events
