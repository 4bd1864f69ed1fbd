#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace chunkup::upload {

/// Default chunk size for uploads (1 MiB)
inline constexpr std::size_t kDefaultChunkSize = 1024 * 1024;

/**
 * @brief Server-issued credential for one resumable upload
 *
 * Immutable once obtained and never reused across files.
 */
struct UploadTicket {
    std::string ticket_id;
    std::string upload_link_secure;  ///< Pre-authorized upload target
    std::string complete_uri;        ///< Completion callback (DELETE)
    std::string uri;                 ///< Resource the upload will become, if reported
    std::string upload_link;
    std::uint64_t free_space = 0;    ///< Remaining account quota in bytes
};

enum class UploadState {
    NotStarted,
    InProgress,
    AwaitingVerification,
    Completed,
    Failed
};

enum class VerificationStatus {
    InProgress,
    Completed,
    NotFound
};

/**
 * @brief Server's view of an upload, produced by one verification probe
 *
 * bytes_written is empty when the server gave no usable offset.
 */
struct VerificationResult {
    VerificationStatus status = VerificationStatus::InProgress;
    std::optional<std::uint64_t> bytes_written;
    int status_code = 0;  ///< HTTP status of the probe
};

/**
 * @brief What happened to one transmitted chunk
 *
 * NeedsReverify means the server answered with the resume status: its
 * durable offset may differ from ours, so the next step is a verification
 * rather than another chunk.
 */
enum class ChunkOutcome {
    Sent,
    NeedsReverify
};

const char* to_string(UploadState state);
const char* to_string(VerificationStatus status);
const char* to_string(ChunkOutcome outcome);

} // namespace chunkup::upload
