#pragma once

#include "chunkup/network/http_transport.hpp"
#include "chunkup/upload/byte_range.hpp"
#include "chunkup/upload/errors.hpp"
#include "chunkup/upload/session.hpp"
#include "chunkup/upload/types.hpp"

namespace chunkup::upload {

/**
 * @brief Sends one byte range of the session's source to the upload link
 *
 * Reads the window from the content source and PUTs it without the
 * Authorization header. Offset bookkeeping stays with the caller: the
 * session is only read.
 */
class ChunkTransmitter {
public:
    explicit ChunkTransmitter(network::HttpTransport& transport);

    /// Window for the session's next chunk
    static ByteRange next_range(const UploadSession& session);

    /**
     * @return Sent for 2xx, NeedsReverify for 308, a Protocol error for any
     *         other status, an Upload error if the source or transport fails
     */
    UploadResult<ChunkOutcome> send(const UploadSession& session, const ByteRange& range) const;

private:
    network::HttpTransport& transport_;
};

} // namespace chunkup::upload
