#pragma once

#include "chunkup/core/result.hpp"
#include "chunkup/upload/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace chunkup::upload {

class UploadSession;

enum class ErrorKind {
    Protocol,      ///< Server answered with an unexpected status for a step
    Upload,        ///< Client-side failure: transport, bad ticket JSON, quota, inconsistent server state
    Precondition   ///< Rejected before any request was attempted
};

/**
 * @brief Copy of the in-flight session's progress at the time of an error
 *
 * Carries the whole ticket, so UploadClient::resume_session() can rebuild
 * the session on the same ticket once the session object itself is gone.
 */
struct SessionSnapshot {
    std::string ticket_id;
    UploadState state = UploadState::NotStarted;
    std::uint64_t bytes_written = 0;
    std::uint64_t file_length = 0;
    std::string clip_uri;
    UploadTicket ticket;
    std::size_t chunk_size = 0;
    bool retryable = true;
};

struct UploadError {
    ErrorKind kind = ErrorKind::Upload;
    std::string step;                     ///< e.g. "upload_chunk", "verify_upload"
    std::string message;
    std::string cause;                    ///< Wrapped lower-level failure, if any
    std::optional<int> status_code;
    bool retryable = true;
    std::optional<SessionSnapshot> session;

    static UploadError protocol(std::string step, int status_code, std::string message);
    static UploadError upload(std::string step, std::string message, std::string cause = {});
    static UploadError precondition(std::string step, std::string message);

    UploadError& with_session(const UploadSession& session);
    UploadError& non_retryable();

    /// One-line description including step, status and cause
    std::string describe() const;
};

template<typename T>
using UploadResult = Result<T, UploadError>;

const char* to_string(ErrorKind kind);

} // namespace chunkup::upload
