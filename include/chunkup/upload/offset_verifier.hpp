#pragma once

#include "chunkup/network/http_transport.hpp"
#include "chunkup/upload/errors.hpp"
#include "chunkup/upload/session.hpp"
#include "chunkup/upload/types.hpp"

namespace chunkup::upload {

/**
 * @brief Asks the upload target how many bytes it durably holds
 *
 * Sends an empty PUT to the ticket's upload link. Stateless: it never
 * touches the session, so probing twice against a stable server yields the
 * same answer.
 */
class OffsetVerifier {
public:
    explicit OffsetVerifier(network::HttpTransport& transport);

    UploadResult<VerificationResult> verify(const UploadSession& session) const;

    /**
     * @brief Map a probe response to a VerificationResult
     *
     * 200 -> Completed with file_length bytes. 308 -> InProgress, with the
     * byte count from a well-formed Range header (Completed if it covers
     * the whole file). Anything else -> NotFound. A missing or malformed
     * Range header leaves bytes_written empty.
     */
    static VerificationResult interpret(const network::HttpResponse& response, std::uint64_t file_length);

private:
    network::HttpTransport& transport_;
};

} // namespace chunkup::upload
