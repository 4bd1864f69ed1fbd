#pragma once

#include "chunkup/network/http_transport.hpp"
#include "chunkup/upload/errors.hpp"
#include "chunkup/upload/types.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace chunkup::upload {

/**
 * @brief Ticket endpoints of the upload API
 *
 * Ticket requests and the completion call carry the account's credentials;
 * the upload link they hand out does not need them.
 */
class TicketClient {
public:
    TicketClient(network::HttpTransport& transport, std::string api_base_url);

    /// POST {api}/me/videos?type=streaming
    UploadResult<UploadTicket> request_ticket() const;

    /// PUT {api}/videos/{id}/files?type=streaming
    UploadResult<UploadTicket> request_replace_ticket(std::uint64_t video_id) const;

    /**
     * @brief DELETE the ticket's completion URI
     *
     * @return The Location header of the response, if the server sent one
     */
    UploadResult<std::optional<std::string>> complete(const UploadTicket& ticket) const;

    const std::string& api_base_url() const noexcept { return api_base_url_; }

private:
    UploadResult<UploadTicket> fetch_ticket(network::HttpMethod method,
                                            const std::string& path,
                                            const std::string& step,
                                            const std::string& failure_message) const;

    network::HttpTransport& transport_;
    std::string api_base_url_;
};

/**
 * @brief Decode the JSON ticket document
 *
 * Quota is read from user.upload_quota.space.free, falling back to
 * quota.free_space.
 */
UploadResult<UploadTicket> parse_ticket(const std::string& json_text, const std::string& step);

/// Ticket has an id, an upload link and a completion URI
UploadResult<void> check_ticket(const UploadTicket& ticket, const std::string& step);

/// Payload fits in the account's remaining space
UploadResult<void> check_quota(const UploadTicket& ticket, std::uint64_t file_length, const std::string& step);

} // namespace chunkup::upload
