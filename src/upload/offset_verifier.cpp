#include "chunkup/upload/offset_verifier.hpp"

#include "chunkup/upload/byte_range.hpp"
#include "chunkup/upload/ticket_client.hpp"

#include <spdlog/spdlog.h>

namespace chunkup::upload {

using network::HttpMethod;
using network::HttpRequest;
using network::HttpResponse;
using network::HttpStatus;

namespace {
const std::string kStep = "verify_upload";
} // namespace

OffsetVerifier::OffsetVerifier(network::HttpTransport& transport)
    : transport_(transport) {
}

UploadResult<VerificationResult> OffsetVerifier::verify(const UploadSession& session) const {
    const UploadTicket& ticket = session.ticket();
    if (auto valid = check_ticket(ticket, kStep); valid.is_error()) {
        return Err(valid.error().with_session(session));
    }
    if (auto quota = check_quota(ticket, session.file_length(), kStep); quota.is_error()) {
        return Err(quota.error().with_session(session));
    }

    HttpRequest request;
    request.method = HttpMethod::PUT;
    request.url = ticket.upload_link_secure;
    request.requires_auth = false;
    request.set_header("Content-Length", "0");
    request.set_header("Content-Range", "bytes */" + std::to_string(session.file_length()));

    auto response = transport_.send(request);
    if (response.is_error()) {
        return Err(UploadError::upload(kStep, "Error verifying file upload.", response.error())
                       .with_session(session));
    }

    const VerificationResult result = interpret(response.value(), session.file_length());
    if (result.bytes_written) {
        spdlog::debug("Verified ticket {}: {} with {} of {} bytes", ticket.ticket_id,
                      to_string(result.status), *result.bytes_written, session.file_length());
    } else {
        spdlog::debug("Verified ticket {}: {} (no offset reported, HTTP {})", ticket.ticket_id,
                      to_string(result.status), response.value().status_code);
    }
    return Ok(result);
}

VerificationResult OffsetVerifier::interpret(const HttpResponse& response, std::uint64_t file_length) {
    VerificationResult result;
    result.status_code = response.status_code;

    if (response.status_code == static_cast<int>(HttpStatus::OK)) {
        result.status = VerificationStatus::Completed;
        result.bytes_written = file_length;
        return result;
    }

    if (response.status_code != static_cast<int>(HttpStatus::RESUME_INCOMPLETE)) {
        result.status = VerificationStatus::NotFound;
        return result;
    }

    result.status = VerificationStatus::InProgress;
    const auto header = response.find_header("Range");
    if (!header) {
        return result;
    }

    const auto range = parse_range_header(*header);
    if (!range) {
        spdlog::warn("Ignoring malformed Range header: '{}'", *header);
        return result;
    }

    result.bytes_written = range->bytes_written();
    if (*result.bytes_written == file_length) {
        result.status = VerificationStatus::Completed;
    }
    return result;
}

} // namespace chunkup::upload
