#pragma once

#include "chunkup/events/event_bus.hpp"
#include "chunkup/network/http_transport.hpp"
#include "chunkup/upload/chunk_transmitter.hpp"
#include "chunkup/upload/content_source.hpp"
#include "chunkup/upload/errors.hpp"
#include "chunkup/upload/offset_verifier.hpp"
#include "chunkup/upload/session.hpp"
#include "chunkup/upload/ticket_client.hpp"
#include "chunkup/upload/types.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace chunkup::upload {

/**
 * @brief What the upload loop does after a verification has been applied
 */
enum class NextStep {
    SendChunks,  ///< Session is back in InProgress
    Reverify,    ///< Nothing learned and nothing left to send: probe again
    Complete     ///< Server holds every byte: make the completion call
};

const char* to_string(NextStep step);

/**
 * @brief Apply one verification result to a session awaiting verification
 *
 * Completed marks the session verified. A server count below the file
 * length is adopted through reconcile(). A count at or past the file
 * length without a Completed status and a NotFound status are both fatal
 * and non-retryable. A result without a count resumes sending if bytes
 * remain, otherwise asks for another probe.
 *
 * The session is not marked failed here; the caller decides that.
 */
UploadResult<NextStep> apply_verification(UploadSession& session, const VerificationResult& result);

/**
 * @brief Drives upload sessions from ticket acquisition to completion
 *
 * Holds no per-session state: several sessions can be driven from
 * different threads as long as each uses its own transport and source.
 *
 * EXAMPLE:
 * AsioHttpTransport transport({token});
 * UploadClient client(transport, {"http://localhost:8080"});
 * auto source = FileContentSource::open("movie.mp4");
 * auto session = client.upload_entire_file(*source.value());
 */
class UploadClient {
public:
    struct Options {
        std::string api_base_url;
        /// Consecutive probes without a usable offset before giving up (at least 1)
        std::uint32_t max_uninformative_verifications = 3;
    };

    UploadClient(network::HttpTransport& transport, Options options, events::EventBus* bus = nullptr);

    UploadResult<UploadTicket> get_upload_ticket() const;
    UploadResult<UploadTicket> get_replace_upload_ticket(std::uint64_t video_id) const;

    /**
     * @brief Check preconditions, acquire a ticket and begin a session
     *
     * Rejects a zero chunk size or unreadable source before any request,
     * and a file larger than the ticket's quota before any byte is sent.
     * A seekable source is rewound to 0.
     */
    UploadResult<UploadSession> create_session(ContentSource& source,
                                               std::size_t chunk_size = kDefaultChunkSize,
                                               std::optional<std::uint64_t> replace_video_id = std::nullopt) const;

    /// create_session() followed by the first chunk
    UploadResult<UploadSession> start_upload(ContentSource& source,
                                             std::size_t chunk_size = kDefaultChunkSize,
                                             std::optional<std::uint64_t> replace_video_id = std::nullopt) const;

    /**
     * @brief Send the next chunk
     *
     * With all bytes written this is a no-op reporting InProgress at the
     * current offset. A resume status from the server triggers an
     * immediate verification whose result is applied to the session and
     * returned.
     */
    UploadResult<VerificationResult> continue_upload(UploadSession& session) const;

    /// Probe the server; a Completed answer marks an awaiting session verified
    UploadResult<VerificationResult> verify_upload(UploadSession& session) const;

    /**
     * @brief Completion call for a verified session
     *
     * @return The clip URI from the Location header; empty if none was sent
     */
    UploadResult<std::string> complete_upload(UploadSession& session) const;

    /**
     * @brief Drive a session until it is completed
     *
     * A retryable Failed session is resumed at its last confirmed offset.
     * On error the session is marked Failed and the error is returned.
     */
    UploadResult<void> upload_session(UploadSession& session) const;

    /**
     * @brief Rebuild a session from an error's snapshot without a new ticket
     *
     * Pass the result to upload_session() to continue at the confirmed offset.
     */
    UploadResult<UploadSession> resume_session(const SessionSnapshot& snapshot, ContentSource& source) const;

    /**
     * @brief Whole pipeline
     *
     * On failure only the error is returned; its snapshot can be handed to
     * resume_session() to continue on the same ticket.
     */
    UploadResult<UploadSession> upload_entire_file(ContentSource& source,
                                                   std::size_t chunk_size = kDefaultChunkSize,
                                                   std::optional<std::uint64_t> replace_video_id = std::nullopt) const;

    const Options& options() const noexcept { return options_; }

private:
    UploadResult<void> align_source(UploadSession& session, const std::string& step) const;
    UploadResult<NextStep> apply_and_publish(UploadSession& session, const VerificationResult& result) const;
    UploadError fail(UploadSession& session, UploadError error) const;

    template<typename EventType>
    void publish(const EventType& event) const {
        if (bus_) {
            bus_->emit(event);
        }
    }

    Options options_;
    TicketClient tickets_;
    ChunkTransmitter transmitter_;
    OffsetVerifier verifier_;
    events::EventBus* bus_;
};

} // namespace chunkup::upload
