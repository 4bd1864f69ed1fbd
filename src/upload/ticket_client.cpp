#include "chunkup/upload/ticket_client.hpp"

#include "chunkup/network/url.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace chunkup::upload {

using json = nlohmann::json;
using network::HttpMethod;
using network::HttpRequest;

namespace {

std::string string_field(const json& j, const char* key) {
    const auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

std::optional<std::uint64_t> unsigned_at(const json& j, const json::json_pointer& pointer) {
    if (!j.contains(pointer)) {
        return std::nullopt;
    }
    const auto& value = j.at(pointer);
    if (value.is_number_unsigned()) {
        return value.get<std::uint64_t>();
    }
    if (value.is_number_integer() && value.get<std::int64_t>() >= 0) {
        return static_cast<std::uint64_t>(value.get<std::int64_t>());
    }
    return std::nullopt;
}

} // namespace

TicketClient::TicketClient(network::HttpTransport& transport, std::string api_base_url)
    : transport_(transport)
    , api_base_url_(std::move(api_base_url)) {
    while (!api_base_url_.empty() && api_base_url_.back() == '/') {
        api_base_url_.pop_back();
    }
}

UploadResult<UploadTicket> TicketClient::request_ticket() const {
    return fetch_ticket(HttpMethod::POST, "/me/videos",
                        "get_upload_ticket", "Error generating upload ticket.");
}

UploadResult<UploadTicket> TicketClient::request_replace_ticket(std::uint64_t video_id) const {
    return fetch_ticket(HttpMethod::PUT, "/videos/" + std::to_string(video_id) + "/files",
                        "get_replace_upload_ticket", "Error generating upload ticket to replace video.");
}

UploadResult<std::optional<std::string>> TicketClient::complete(const UploadTicket& ticket) const {
    const std::string step = "complete_upload";
    const std::string failure = "Error marking file upload as complete.";

    if (ticket.complete_uri.empty()) {
        return Err(UploadError::precondition(step, "Upload ticket has no completion URI."));
    }
    auto target = network::resolve_url(api_base_url_, ticket.complete_uri);
    if (target.is_error()) {
        return Err(UploadError::precondition(step, "Invalid completion URI: " + target.error()));
    }

    HttpRequest request;
    request.method = HttpMethod::DELETE_METHOD;
    request.url = target.value();
    request.requires_auth = true;

    auto response = transport_.send(request);
    if (response.is_error()) {
        return Err(UploadError::upload(step, failure, response.error()));
    }
    if (!response.value().is_success()) {
        return Err(UploadError::protocol(step, response.value().status_code, failure));
    }

    spdlog::debug("Completion call for ticket {} returned {}", ticket.ticket_id, response.value().status_code);
    return Ok(response.value().find_header("Location"));
}

UploadResult<UploadTicket> TicketClient::fetch_ticket(HttpMethod method,
                                                      const std::string& path,
                                                      const std::string& step,
                                                      const std::string& failure_message) const {
    HttpRequest request;
    request.method = method;
    request.url = network::append_query(api_base_url_ + path, "type", "streaming");
    request.requires_auth = true;

    auto response = transport_.send(request);
    if (response.is_error()) {
        return Err(UploadError::upload(step, failure_message, response.error()));
    }
    if (!response.value().is_success()) {
        return Err(UploadError::protocol(step, response.value().status_code, failure_message));
    }

    auto ticket = parse_ticket(response.value().body_as_string(), step);
    if (ticket.is_error()) {
        return ticket;
    }
    if (auto valid = check_ticket(ticket.value(), step); valid.is_error()) {
        return Err(UploadError::upload(step, "Server returned an incomplete upload ticket.", valid.error().message));
    }

    spdlog::info("Acquired upload ticket {} ({} bytes free)", ticket.value().ticket_id, ticket.value().free_space);
    return ticket;
}

UploadResult<UploadTicket> parse_ticket(const std::string& json_text, const std::string& step) {
    const json document = json::parse(json_text, nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        return Err(UploadError::upload(step, "Malformed upload ticket.", "response body is not a JSON object"));
    }

    UploadTicket ticket;
    ticket.ticket_id = string_field(document, "ticket_id");
    ticket.upload_link_secure = string_field(document, "upload_link_secure");
    ticket.complete_uri = string_field(document, "complete_uri");
    ticket.uri = string_field(document, "uri");
    ticket.upload_link = string_field(document, "upload_link");

    auto free_space = unsigned_at(document, json::json_pointer("/user/upload_quota/space/free"));
    if (!free_space) {
        free_space = unsigned_at(document, json::json_pointer("/quota/free_space"));
    }
    if (!free_space) {
        return Err(UploadError::upload(step, "Malformed upload ticket.", "no free space quota reported"));
    }
    ticket.free_space = *free_space;
    return Ok(std::move(ticket));
}

UploadResult<void> check_ticket(const UploadTicket& ticket, const std::string& step) {
    if (ticket.ticket_id.find_first_not_of(" \t\r\n") == std::string::npos) {
        return Err(UploadError::precondition(step, "Invalid upload ticket."));
    }
    if (ticket.upload_link_secure.empty()) {
        return Err(UploadError::precondition(step, "Upload ticket has no upload link."));
    }
    if (ticket.complete_uri.empty()) {
        return Err(UploadError::precondition(step, "Upload ticket has no completion URI."));
    }
    return Ok();
}

UploadResult<void> check_quota(const UploadTicket& ticket, std::uint64_t file_length, const std::string& step) {
    if (file_length > ticket.free_space) {
        return Err(UploadError::upload(step,
            "User does not have enough free space to upload this file. Remaining space: " +
            std::to_string(ticket.free_space) + ".").non_retryable());
    }
    return Ok();
}

} // namespace chunkup::upload
