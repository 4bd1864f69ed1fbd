#include "chunkup/upload/errors.hpp"

#include "chunkup/upload/session.hpp"

#include <sstream>

namespace chunkup::upload {

const char* to_string(UploadState state) {
    switch (state) {
        case UploadState::NotStarted: return "NotStarted";
        case UploadState::InProgress: return "InProgress";
        case UploadState::AwaitingVerification: return "AwaitingVerification";
        case UploadState::Completed: return "Completed";
        case UploadState::Failed: return "Failed";
    }
    return "Unknown";
}

const char* to_string(VerificationStatus status) {
    switch (status) {
        case VerificationStatus::InProgress: return "InProgress";
        case VerificationStatus::Completed: return "Completed";
        case VerificationStatus::NotFound: return "NotFound";
    }
    return "Unknown";
}

const char* to_string(ChunkOutcome outcome) {
    switch (outcome) {
        case ChunkOutcome::Sent: return "Sent";
        case ChunkOutcome::NeedsReverify: return "NeedsReverify";
    }
    return "Unknown";
}

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Protocol: return "protocol";
        case ErrorKind::Upload: return "upload";
        case ErrorKind::Precondition: return "precondition";
    }
    return "unknown";
}

UploadError UploadError::protocol(std::string step, int status_code, std::string message) {
    UploadError error;
    error.kind = ErrorKind::Protocol;
    error.step = std::move(step);
    error.status_code = status_code;
    error.message = std::move(message);
    return error;
}

UploadError UploadError::upload(std::string step, std::string message, std::string cause) {
    UploadError error;
    error.kind = ErrorKind::Upload;
    error.step = std::move(step);
    error.message = std::move(message);
    error.cause = std::move(cause);
    return error;
}

UploadError UploadError::precondition(std::string step, std::string message) {
    UploadError error;
    error.kind = ErrorKind::Precondition;
    error.step = std::move(step);
    error.message = std::move(message);
    error.retryable = false;
    return error;
}

UploadError& UploadError::with_session(const UploadSession& session) {
    this->session = session.snapshot();
    return *this;
}

UploadError& UploadError::non_retryable() {
    retryable = false;
    return *this;
}

std::string UploadError::describe() const {
    std::ostringstream oss;
    oss << "[" << to_string(kind) << "] " << step << ": " << message;
    if (status_code) {
        oss << " (HTTP " << *status_code << ")";
    }
    if (!cause.empty()) {
        oss << ": " << cause;
    }
    if (session) {
        oss << " [ticket=" << session->ticket_id
            << " state=" << to_string(session->state)
            << " written=" << session->bytes_written << "/" << session->file_length << "]";
    }
    return oss.str();
}

} // namespace chunkup::upload
