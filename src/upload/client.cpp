#include "chunkup/upload/client.hpp"

#include "chunkup/events/events.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>

namespace chunkup::upload {
namespace {

UploadError transition_error(const std::string& step, const std::string& message) {
    return UploadError::precondition(step, message);
}

UploadResult<VerificationResult> in_progress_at(const UploadSession& session) {
    VerificationResult result;
    result.status = VerificationStatus::InProgress;
    result.bytes_written = session.bytes_written();
    return Ok(result);
}

} // namespace

const char* to_string(NextStep step) {
    switch (step) {
        case NextStep::SendChunks: return "SendChunks";
        case NextStep::Reverify: return "Reverify";
        case NextStep::Complete: return "Complete";
    }
    return "Unknown";
}

UploadResult<NextStep> apply_verification(UploadSession& session, const VerificationResult& result) {
    const std::string step = "verify_upload";

    if (session.state() != UploadState::AwaitingVerification) {
        return Err(transition_error(step, std::string("Cannot apply a verification in state ") +
                                          to_string(session.state())).with_session(session));
    }

    switch (result.status) {
        case VerificationStatus::Completed: {
            if (auto res = session.mark_verified_complete(); res.is_error()) {
                return Err(transition_error(step, res.error()).with_session(session));
            }
            return Ok(NextStep::Complete);
        }

        case VerificationStatus::NotFound:
            return Err(UploadError::protocol(step, result.status_code, "Upload not found on the server.")
                           .non_retryable()
                           .with_session(session));

        case VerificationStatus::InProgress:
            break;
    }

    if (result.bytes_written) {
        const std::uint64_t server_bytes = *result.bytes_written;
        if (server_bytes >= session.file_length()) {
            return Err(UploadError::upload(step,
                "Server reports " + std::to_string(server_bytes) +
                " bytes written but the upload is not complete; expected " +
                std::to_string(session.file_length()) + " bytes.")
                           .non_retryable()
                           .with_session(session));
        }
        if (auto res = session.reconcile(server_bytes); res.is_error()) {
            return Err(transition_error(step, res.error()).with_session(session));
        }
        return Ok(NextStep::SendChunks);
    }

    if (session.all_bytes_written()) {
        return Ok(NextStep::Reverify);
    }
    if (auto res = session.resume_sending(); res.is_error()) {
        return Err(transition_error(step, res.error()).with_session(session));
    }
    return Ok(NextStep::SendChunks);
}

UploadClient::UploadClient(network::HttpTransport& transport, Options options, events::EventBus* bus)
    : options_(std::move(options))
    , tickets_(transport, options_.api_base_url)
    , transmitter_(transport)
    , verifier_(transport)
    , bus_(bus) {
    options_.max_uninformative_verifications = std::max<std::uint32_t>(1, options_.max_uninformative_verifications);
}

UploadResult<UploadTicket> UploadClient::get_upload_ticket() const {
    return tickets_.request_ticket();
}

UploadResult<UploadTicket> UploadClient::get_replace_upload_ticket(std::uint64_t video_id) const {
    return tickets_.request_replace_ticket(video_id);
}

UploadResult<UploadSession> UploadClient::create_session(ContentSource& source,
                                                         std::size_t chunk_size,
                                                         std::optional<std::uint64_t> replace_video_id) const {
    const std::string step = "create_session";

    if (chunk_size == 0) {
        return Err(UploadError::precondition(step, "Chunk size must be greater than zero."));
    }
    if (!source.is_readable()) {
        return Err(UploadError::precondition(step, "Content source is not readable."));
    }

    auto ticket = replace_video_id ? get_replace_upload_ticket(*replace_video_id) : get_upload_ticket();
    if (ticket.is_error()) {
        return Err(ticket.error());
    }
    if (auto quota = check_quota(ticket.value(), source.length(), step); quota.is_error()) {
        return Err(quota.error());
    }

    UploadSession session(std::move(ticket.value()), source, chunk_size);
    if (auto aligned = align_source(session, step); aligned.is_error()) {
        return Err(aligned.error());
    }
    if (auto res = session.begin(); res.is_error()) {
        return Err(transition_error(step, res.error()).with_session(session));
    }

    events::UploadStartedEvent started;
    started.ticket_id = session.ticket().ticket_id;
    started.file_length = session.file_length();
    started.chunk_size = session.chunk_size();
    publish(started);

    return Ok(std::move(session));
}

UploadResult<UploadSession> UploadClient::start_upload(ContentSource& source,
                                                       std::size_t chunk_size,
                                                       std::optional<std::uint64_t> replace_video_id) const {
    auto session = create_session(source, chunk_size, replace_video_id);
    if (session.is_error()) {
        return session;
    }
    if (auto first = continue_upload(session.value()); first.is_error()) {
        return Err(first.error());
    }
    return session;
}

UploadResult<VerificationResult> UploadClient::continue_upload(UploadSession& session) const {
    const std::string step = "upload_chunk";

    if (session.all_bytes_written()) {
        return in_progress_at(session);
    }

    if (session.state() == UploadState::InProgress) {
        // A failed send leaves the source past the unconfirmed window
        if (auto aligned = align_source(session, step); aligned.is_error()) {
            return Err(aligned.error());
        }
        const ByteRange range = ChunkTransmitter::next_range(session);
        auto outcome = transmitter_.send(session, range);
        if (outcome.is_error()) {
            return Err(outcome.error());
        }

        if (outcome.value() == ChunkOutcome::Sent) {
            if (auto res = session.record_chunk_sent(); res.is_error()) {
                return Err(transition_error(step, res.error()).with_session(session));
            }

            events::ChunkSentEvent sent;
            sent.ticket_id = session.ticket().ticket_id;
            sent.range_start = range.start;
            sent.range_end = range.end;
            sent.bytes_written = session.bytes_written();
            sent.file_length = session.file_length();
            publish(sent);

            return in_progress_at(session);
        }

        if (auto res = session.request_verification(); res.is_error()) {
            return Err(transition_error(step, res.error()).with_session(session));
        }
    } else if (session.state() != UploadState::AwaitingVerification) {
        return Err(transition_error(step, std::string("Cannot send a chunk in state ") +
                                          to_string(session.state())).with_session(session));
    }

    auto verification = verify_upload(session);
    if (verification.is_error()) {
        return verification;
    }
    if (auto next = apply_and_publish(session, verification.value()); next.is_error()) {
        return Err(next.error());
    }
    return verification;
}

UploadResult<VerificationResult> UploadClient::verify_upload(UploadSession& session) const {
    auto verification = verifier_.verify(session);
    if (verification.is_error()) {
        return verification;
    }
    const VerificationResult& result = verification.value();

    events::UploadVerifiedEvent verified;
    verified.ticket_id = session.ticket().ticket_id;
    verified.status = result.status;
    verified.offset_reported = result.bytes_written.has_value();
    verified.bytes_written = result.bytes_written.value_or(0);
    verified.file_length = session.file_length();
    publish(verified);

    if (result.status == VerificationStatus::Completed &&
        session.state() == UploadState::AwaitingVerification &&
        !session.is_verified_complete()) {
        if (auto res = session.mark_verified_complete(); res.is_error()) {
            return Err(transition_error("verify_upload", res.error()).with_session(session));
        }
    }
    return verification;
}

UploadResult<std::string> UploadClient::complete_upload(UploadSession& session) const {
    const std::string step = "complete_upload";

    if (!session.is_verified_complete()) {
        return Err(UploadError::precondition(step, "Upload has not been verified as complete.")
                       .with_session(session));
    }

    auto location = tickets_.complete(session.ticket());
    if (location.is_error()) {
        return Err(location.error().with_session(session));
    }

    std::string clip_uri = location.value().value_or(std::string());
    if (clip_uri.empty()) {
        spdlog::warn("Completion of ticket {} returned no Location header", session.ticket().ticket_id);
    }
    if (auto res = session.mark_completed(clip_uri); res.is_error()) {
        return Err(transition_error(step, res.error()).with_session(session));
    }

    events::UploadCompletedEvent completed;
    completed.ticket_id = session.ticket().ticket_id;
    completed.clip_uri = clip_uri;
    completed.file_length = session.file_length();
    completed.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - session.started_at());
    publish(completed);

    return Ok(std::move(clip_uri));
}

UploadResult<void> UploadClient::upload_session(UploadSession& session) const {
    const std::string step = "upload_session";

    if (session.is_completed()) {
        return Ok();
    }

    if (session.state() == UploadState::Failed) {
        if (auto res = session.resume(); res.is_error()) {
            return Err(transition_error(step, res.error()).with_session(session));
        }
        spdlog::info("Resuming upload {} at {} of {} bytes",
                     session.ticket().ticket_id, session.bytes_written(), session.file_length());
    }

    if (session.state() == UploadState::NotStarted) {
        if (auto res = session.begin(); res.is_error()) {
            return Err(transition_error(step, res.error()).with_session(session));
        }
        events::UploadStartedEvent started;
        started.ticket_id = session.ticket().ticket_id;
        started.file_length = session.file_length();
        started.chunk_size = session.chunk_size();
        publish(started);
    }

    if (auto aligned = align_source(session, step); aligned.is_error()) {
        return Err(fail(session, aligned.error()));
    }

    std::uint32_t uninformative = 0;
    while (!session.is_completed()) {
        if (session.state() == UploadState::InProgress) {
            auto chunk = continue_upload(session);
            if (chunk.is_error()) {
                return Err(fail(session, chunk.error()));
            }
            if (chunk.value().bytes_written) {
                uninformative = 0;
            } else {
                // Resume status on the chunk and a probe without an offset
                if (++uninformative >= options_.max_uninformative_verifications) {
                    return Err(fail(session, UploadError::upload("verify_upload",
                        "Server did not report an upload offset after " +
                        std::to_string(uninformative) + " verifications.")));
                }
            }
            continue;
        }

        if (session.state() != UploadState::AwaitingVerification) {
            return Err(fail(session, transition_error(step, std::string("Unexpected session state ") +
                                                            to_string(session.state()))));
        }

        if (session.is_verified_complete()) {
            if (auto completed = complete_upload(session); completed.is_error()) {
                return Err(fail(session, completed.error()));
            }
            continue;
        }

        auto verification = verify_upload(session);
        if (verification.is_error()) {
            return Err(fail(session, verification.error()));
        }

        const VerificationResult& result = verification.value();
        if (result.status == VerificationStatus::InProgress && !result.bytes_written) {
            if (++uninformative >= options_.max_uninformative_verifications) {
                return Err(fail(session, UploadError::upload("verify_upload",
                    "Server did not report an upload offset after " +
                    std::to_string(uninformative) + " verifications.")));
            }
        } else {
            uninformative = 0;
        }

        if (auto next = apply_and_publish(session, result); next.is_error()) {
            return Err(fail(session, next.error()));
        }
    }

    spdlog::info("Upload {} completed: {}", session.ticket().ticket_id,
                 session.clip_uri().empty() ? "<no location>" : session.clip_uri());
    return Ok();
}

UploadResult<UploadSession> UploadClient::upload_entire_file(ContentSource& source,
                                                             std::size_t chunk_size,
                                                             std::optional<std::uint64_t> replace_video_id) const {
    auto session = create_session(source, chunk_size, replace_video_id);
    if (session.is_error()) {
        return session;
    }
    if (auto uploaded = upload_session(session.value()); uploaded.is_error()) {
        return Err(uploaded.error());
    }
    return session;
}

UploadResult<UploadSession> UploadClient::resume_session(const SessionSnapshot& snapshot,
                                                         ContentSource& source) const {
    const std::string step = "resume_session";

    if (!source.is_readable()) {
        return Err(UploadError::precondition(step, "Content source is not readable."));
    }
    if (auto valid = check_ticket(snapshot.ticket, step); valid.is_error()) {
        return Err(valid.error());
    }

    auto restored = UploadSession::restore(snapshot, source);
    if (restored.is_error()) {
        return Err(UploadError::precondition(step, restored.error()));
    }
    spdlog::info("Restored upload {} at {} of {} bytes",
                 snapshot.ticket.ticket_id, snapshot.bytes_written, snapshot.file_length);
    return Ok(std::move(restored.value()));
}

UploadResult<void> UploadClient::align_source(UploadSession& session, const std::string& step) const {
    ContentSource& source = session.source();
    if (!source.is_seekable() || source.position() == session.bytes_written()) {
        return Ok();
    }
    if (auto res = source.seek(session.bytes_written()); res.is_error()) {
        return Err(UploadError::upload(step, "Error seeking file to offset " +
                                             std::to_string(session.bytes_written()) + ".", res.error())
                       .with_session(session));
    }
    return Ok();
}

UploadResult<NextStep> UploadClient::apply_and_publish(UploadSession& session, const VerificationResult& result) const {
    const std::uint64_t client_bytes = session.bytes_written();

    auto next = apply_verification(session, result);
    if (next.is_error()) {
        return next;
    }

    if (next.value() == NextStep::SendChunks) {
        if (result.bytes_written) {
            spdlog::warn("Upload {}: server holds {} bytes, client had {}; resending from {}",
                         session.ticket().ticket_id, *result.bytes_written, client_bytes, session.bytes_written());

            events::OffsetReconciledEvent reconciled;
            reconciled.ticket_id = session.ticket().ticket_id;
            reconciled.client_bytes_written = client_bytes;
            reconciled.server_bytes_written = session.bytes_written();
            reconciled.file_length = session.file_length();
            publish(reconciled);
        }
        if (auto aligned = align_source(session, "verify_upload"); aligned.is_error()) {
            return Err(aligned.error());
        }
    }
    return next;
}

UploadError UploadClient::fail(UploadSession& session, UploadError error) const {
    if (!session.is_completed() && session.state() != UploadState::Failed) {
        if (auto res = session.mark_failed(error.message, error.retryable); res.is_error()) {
            spdlog::warn("Could not mark upload {} failed: {}", session.ticket().ticket_id, res.error());
        }
    }
    error.with_session(session);

    events::UploadFailedEvent failed;
    failed.ticket_id = session.ticket().ticket_id;
    failed.error_message = error.describe();
    failed.bytes_written = session.bytes_written();
    failed.retryable = error.retryable;
    publish(failed);

    return error;
}

} // namespace chunkup::upload
