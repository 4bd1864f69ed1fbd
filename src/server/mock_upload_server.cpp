#include "chunkup/server/mock_upload_server.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>
#include <csignal>
#include <strings.h>

namespace chunkup::server {

using json = nlohmann::json;
using network::HttpMethod;
using network::HttpRequest;
using network::HttpResponse;
using network::HttpStatus;

namespace {

std::vector<std::string> split_path(const std::string& target) {
    const std::string path = target.substr(0, target.find('?'));
    std::vector<std::string> segments;
    std::size_t pos = 0;
    while (pos < path.size()) {
        const std::size_t next = path.find('/', pos);
        const std::size_t end = next == std::string::npos ? path.size() : next;
        if (end > pos) {
            segments.push_back(path.substr(pos, end - pos));
        }
        pos = end + 1;
    }
    return segments;
}

std::optional<std::uint64_t> parse_number(const std::string& text) {
    std::uint64_t value = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last || first == last) {
        return std::nullopt;
    }
    return value;
}

// "bytes */<length>"
std::optional<std::uint64_t> parse_probe_length(const std::string& content_range) {
    const std::string prefix = "bytes */";
    if (content_range.size() <= prefix.size() ||
        strncasecmp(content_range.c_str(), prefix.c_str(), prefix.size()) != 0) {
        return std::nullopt;
    }
    return parse_number(content_range.substr(prefix.size()));
}

HttpResponse json_response(HttpStatus status, const json& body) {
    HttpResponse response(status);
    response.set_header("Content-Type", "application/json");
    response.set_body(body.dump());
    return response;
}

HttpResponse error_response(HttpStatus status, const std::string& message) {
    return json_response(status, json{{"error", message}});
}

} // namespace

MockUploadServer::MockUploadServer()
    : MockUploadServer(Options{}) {
}

MockUploadServer::MockUploadServer(Options options)
    : options_(std::move(options))
    , server_(std::make_unique<network::HttpServerAsio>(io_context_, options_.port, options_.address)) {
    server_->set_handler([this](const HttpRequest& request) { return handle(request); });
}

MockUploadServer::~MockUploadServer() {
    stop();
}

void MockUploadServer::start() {
    thread_ = std::thread([this]() { run(); });
}

void MockUploadServer::run() {
    spdlog::info("Mock upload server at {}", base_url());
    io_context_.run();
}

void MockUploadServer::stop_on_signals() {
    signals_ = std::make_unique<boost::asio::signal_set>(io_context_, SIGINT, SIGTERM);
    signals_->async_wait([this](const boost::system::error_code& ec, int signal_number) {
        if (!ec) {
            spdlog::info("Received signal {}, shutting down...", signal_number);
            io_context_.stop();
        }
    });
}

void MockUploadServer::stop() {
    io_context_.stop();
    if (thread_.joinable()) {
        thread_.join();
    }
    server_->stop();
}

std::string MockUploadServer::base_url() const {
    return "http://" + options_.address + ":" + std::to_string(port());
}

void MockUploadServer::inject(const Faults& faults) {
    std::lock_guard lock(mutex_);
    faults_ = faults;
}

std::optional<MockUploadServer::Upload> MockUploadServer::upload(const std::string& ticket_id) const {
    std::lock_guard lock(mutex_);
    const auto it = uploads_.find(ticket_id);
    if (it == uploads_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<MockUploadServer::LoggedRequest> MockUploadServer::requests() const {
    std::lock_guard lock(mutex_);
    return requests_;
}

HttpResponse MockUploadServer::handle(const HttpRequest& request) {
    {
        std::lock_guard lock(mutex_);
        requests_.push_back({request.method, request.url, request.has_header("Authorization"), request.body.size()});
    }

    const auto segments = split_path(request.url);

    if (request.method == HttpMethod::POST && segments.size() == 2 &&
        segments[0] == "me" && segments[1] == "videos") {
        return issue_ticket(request, std::nullopt);
    }

    if (request.method == HttpMethod::PUT && segments.size() == 3 &&
        segments[0] == "videos" && segments[2] == "files") {
        const auto video_id = parse_number(segments[1]);
        if (!video_id) {
            return error_response(HttpStatus::BAD_REQUEST, "Invalid video id: " + segments[1]);
        }
        return issue_ticket(request, video_id);
    }

    if (request.method == HttpMethod::PUT && segments.size() == 2 && segments[0] == "upload") {
        return receive(segments[1], request);
    }

    if (request.method == HttpMethod::DELETE_METHOD && segments.size() == 2 && segments[0] == "uploads") {
        if (!authorized(request)) {
            return error_response(HttpStatus::UNAUTHORIZED, "Missing or invalid access token");
        }
        return complete(segments[1]);
    }

    return error_response(HttpStatus::NOT_FOUND, "No route for " + request.url);
}

HttpResponse MockUploadServer::issue_ticket(const HttpRequest& request,
                                            std::optional<std::uint64_t> replaced_video_id) {
    if (!authorized(request)) {
        return error_response(HttpStatus::UNAUTHORIZED, "Missing or invalid access token");
    }

    std::lock_guard lock(mutex_);
    const std::string ticket_id = "ticket-" + std::to_string(next_ticket_++);

    Upload upload;
    upload.ticket_id = ticket_id;
    upload.replaced_video_id = replaced_video_id;
    uploads_.emplace(ticket_id, std::move(upload));

    const std::string upload_link = base_url() + "/upload/" + ticket_id;
    json body = {
        {"ticket_id", ticket_id},
        {"upload_link_secure", upload_link},
        {"upload_link", upload_link},
        {"complete_uri", "/uploads/" + ticket_id},
    };

    // The replace endpoint reports quota in the older layout
    if (replaced_video_id) {
        body["uri"] = "/videos/" + std::to_string(*replaced_video_id);
        body["quota"] = {{"free_space", options_.free_space}};
    } else {
        body["user"] = {{"upload_quota", {{"space", {{"free", options_.free_space}}}}}};
    }

    spdlog::debug("Issued {}", ticket_id);
    return json_response(HttpStatus::CREATED, body);
}

HttpResponse MockUploadServer::receive(const std::string& ticket_id, const HttpRequest& request) {
    std::lock_guard lock(mutex_);
    const auto it = uploads_.find(ticket_id);
    if (it == uploads_.end()) {
        return error_response(HttpStatus::NOT_FOUND, "Unknown ticket: " + ticket_id);
    }
    Upload& upload = it->second;

    const auto content_range = request.find_header("Content-Range");
    if (request.body.empty() && content_range) {
        return probe(upload, *content_range);
    }

    upload.chunk_requests++;
    if (faults_.fail_chunks > 0) {
        faults_.fail_chunks--;
        return error_response(HttpStatus::INTERNAL_SERVER_ERROR, "Injected chunk failure");
    }
    if (faults_.drop_after_chunks > 0) {
        faults_.drop_after_chunks--;
    } else if (faults_.drop_chunks > 0) {
        faults_.drop_chunks--;
        upload.gap = true;
    }
    if (upload.gap) {
        spdlog::debug("{}: dropping {} byte chunk", ticket_id, request.body.size());
        return HttpResponse(HttpStatus::OK);
    }

    upload.data.insert(upload.data.end(), request.body.begin(), request.body.end());

    if (faults_.resume_on_chunks > 0) {
        faults_.resume_on_chunks--;
        return HttpResponse(HttpStatus::RESUME_INCOMPLETE);
    }
    return HttpResponse(HttpStatus::OK);
}

HttpResponse MockUploadServer::probe(Upload& upload, const std::string& content_range) {
    upload.probe_requests++;

    const auto length = parse_probe_length(content_range);
    if (!length) {
        return error_response(HttpStatus::BAD_REQUEST, "Invalid Content-Range: " + content_range);
    }
    upload.expected_length = *length;
    upload.gap = false;

    if (faults_.truncate_to) {
        const std::uint64_t keep = std::min<std::uint64_t>(*faults_.truncate_to, upload.data.size());
        upload.data.resize(static_cast<std::size_t>(keep));
        faults_.truncate_to.reset();
    }

    if (upload.data.size() == *length) {
        return HttpResponse(HttpStatus::OK);
    }

    HttpResponse response(HttpStatus::RESUME_INCOMPLETE);
    if (faults_.malformed_range_replies > 0) {
        faults_.malformed_range_replies--;
        response.set_header("Range", "bytes=garbage");
    } else if (faults_.omit_range_replies > 0) {
        faults_.omit_range_replies--;
    } else {
        response.set_header("Range", "bytes=0-" + std::to_string(upload.data.size()));
    }
    return response;
}

HttpResponse MockUploadServer::complete(const std::string& ticket_id) {
    std::lock_guard lock(mutex_);
    const auto it = uploads_.find(ticket_id);
    if (it == uploads_.end()) {
        return error_response(HttpStatus::NOT_FOUND, "Unknown ticket: " + ticket_id);
    }
    Upload& upload = it->second;

    if (upload.expected_length && upload.data.size() != *upload.expected_length) {
        return error_response(HttpStatus::BAD_REQUEST, "Upload is incomplete");
    }

    if (upload.clip_uri.empty()) {
        upload.clip_uri = upload.replaced_video_id
            ? "/videos/" + std::to_string(*upload.replaced_video_id)
            : "/videos/" + std::to_string(next_video_++);
    }
    upload.completed = true;

    HttpResponse response(HttpStatus::CREATED);
    if (!faults_.omit_location) {
        response.set_header("Location", upload.clip_uri);
    }
    spdlog::debug("Completed {} as {}", ticket_id, upload.clip_uri);
    return response;
}

bool MockUploadServer::authorized(const HttpRequest& request) const {
    if (options_.access_token.empty()) {
        return true;
    }
    const auto header = request.find_header("Authorization");
    const std::string prefix = "bearer ";
    if (!header || header->size() <= prefix.size() ||
        strncasecmp(header->c_str(), prefix.c_str(), prefix.size()) != 0) {
        return false;
    }
    return header->substr(prefix.size()) == options_.access_token;
}

} // namespace chunkup::server
