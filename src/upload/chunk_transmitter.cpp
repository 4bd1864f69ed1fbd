#include "chunkup/upload/chunk_transmitter.hpp"

#include "chunkup/upload/ticket_client.hpp"

#include <spdlog/spdlog.h>

namespace chunkup::upload {

using network::HttpMethod;
using network::HttpRequest;
using network::HttpStatus;

namespace {
const std::string kStep = "upload_chunk";
} // namespace

ChunkTransmitter::ChunkTransmitter(network::HttpTransport& transport)
    : transport_(transport) {
}

ByteRange ChunkTransmitter::next_range(const UploadSession& session) {
    const ContentSource& source = session.source();
    return compute_chunk_range(session.bytes_written(),
                               session.chunk_size(),
                               session.file_length(),
                               source.is_seekable(),
                               source.is_seekable() ? source.position() : 0);
}

UploadResult<ChunkOutcome> ChunkTransmitter::send(const UploadSession& session, const ByteRange& range) const {
    const UploadTicket& ticket = session.ticket();
    if (auto valid = check_ticket(ticket, kStep); valid.is_error()) {
        return Err(valid.error().with_session(session));
    }
    if (auto quota = check_quota(ticket, session.file_length(), kStep); quota.is_error()) {
        return Err(quota.error().with_session(session));
    }
    if (range.empty()) {
        return Err(UploadError::precondition(kStep, "Refusing to send an empty chunk at offset " +
                                                    std::to_string(range.start) + ".").with_session(session));
    }

    auto bytes = session.source().read_range(range.start, range.end);
    if (bytes.is_error()) {
        return Err(UploadError::upload(kStep, "Error reading file chunk.", bytes.error()).with_session(session));
    }

    HttpRequest request;
    request.method = HttpMethod::PUT;
    request.url = ticket.upload_link_secure;
    request.requires_auth = false;
    request.set_header("Content-Type", "application/octet-stream");
    request.body = std::move(bytes.value());

    auto response = transport_.send(request);
    if (response.is_error()) {
        return Err(UploadError::upload(kStep, "Error uploading file chunk.", response.error()).with_session(session));
    }

    const int status = response.value().status_code;
    if (status == static_cast<int>(HttpStatus::RESUME_INCOMPLETE)) {
        spdlog::debug("Chunk [{}, {}) of ticket {} needs reverification", range.start, range.end, ticket.ticket_id);
        return Ok(ChunkOutcome::NeedsReverify);
    }
    if (!response.value().is_success()) {
        return Err(UploadError::protocol(kStep, status, "Error uploading file chunk.").with_session(session));
    }

    spdlog::debug("Sent chunk [{}, {}) of ticket {}", range.start, range.end, ticket.ticket_id);
    return Ok(ChunkOutcome::Sent);
}

} // namespace chunkup::upload
