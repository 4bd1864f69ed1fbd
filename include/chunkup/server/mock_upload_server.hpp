#pragma once

#include "chunkup/network/http_server_asio.hpp"
#include "chunkup/network/http_types.hpp"

#include <boost/asio.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace chunkup::server {

/**
 * @brief Local stand-in for the upload API
 *
 * Endpoints:
 * - POST /me/videos?type=streaming          new ticket
 * - PUT  /videos/{id}/files?type=streaming  replace ticket
 * - PUT  /upload/{ticket}                   chunk (body appended at the server offset)
 *                                           or probe (empty body, Content-Range: bytes * /L)
 * - DELETE /uploads/{ticket}                completion, answers with Location
 *
 * Faults are one-shot counters consumed by the next matching requests.
 * Only contiguous data is kept: after a dropped chunk every body is
 * discarded until the client probes again.
 *
 * Usage:
 * ```cpp
 * MockUploadServer server;
 * server.start();
 * UploadClient client(transport, {server.base_url()});
 * ```
 */
class MockUploadServer {
public:
    struct Options {
        std::string address = "127.0.0.1";
        uint16_t port = 0;
        std::uint64_t free_space = std::uint64_t(1) << 40;
        /// When non-empty, ticket and completion requests must carry "Authorization: bearer <token>"
        std::string access_token;
    };

    struct Faults {
        std::size_t drop_after_chunks = 0;        ///< Chunks accepted before drop_chunks applies
        std::size_t drop_chunks = 0;              ///< Answer 200 but discard the body
        std::size_t resume_on_chunks = 0;         ///< Store the body but answer 308
        std::size_t fail_chunks = 0;              ///< Answer 500 without storing
        std::optional<std::uint64_t> truncate_to; ///< Cut the stored bytes before the next probe
        std::size_t malformed_range_replies = 0;  ///< Probe answers 308 with an unparseable Range
        std::size_t omit_range_replies = 0;       ///< Probe answers 308 without Range
        bool omit_location = false;               ///< Completion answers without Location
    };

    struct Upload {
        std::string ticket_id;
        std::vector<std::uint8_t> data;
        std::optional<std::uint64_t> expected_length;  ///< From the last probe's Content-Range
        std::optional<std::uint64_t> replaced_video_id;
        std::string clip_uri;
        bool completed = false;
        bool gap = false;  ///< A chunk was lost; later bodies are discarded until the next probe
        std::size_t chunk_requests = 0;
        std::size_t probe_requests = 0;
    };

    struct LoggedRequest {
        network::HttpMethod method = network::HttpMethod::UNKNOWN;
        std::string target;
        bool authorized = false;  ///< Carried an Authorization header
        std::size_t body_size = 0;
    };

    MockUploadServer();
    explicit MockUploadServer(Options options);
    ~MockUploadServer();

    MockUploadServer(const MockUploadServer&) = delete;
    MockUploadServer& operator=(const MockUploadServer&) = delete;

    /// Serve on a background thread
    void start();

    /// Serve on the calling thread until stop() is called from elsewhere
    void run();

    /// Make SIGINT and SIGTERM end run()
    void stop_on_signals();

    void stop();

    uint16_t port() const { return server_->get_port(); }
    std::string base_url() const;

    void inject(const Faults& faults);

    std::optional<Upload> upload(const std::string& ticket_id) const;
    std::vector<LoggedRequest> requests() const;

    /// Request dispatch; usable directly without a socket
    network::HttpResponse handle(const network::HttpRequest& request);

private:
    network::HttpResponse issue_ticket(const network::HttpRequest& request,
                                       std::optional<std::uint64_t> replaced_video_id);
    network::HttpResponse receive(const std::string& ticket_id, const network::HttpRequest& request);
    network::HttpResponse probe(Upload& upload, const std::string& content_range);
    network::HttpResponse complete(const std::string& ticket_id);
    bool authorized(const network::HttpRequest& request) const;

    Options options_;
    boost::asio::io_context io_context_;
    std::unique_ptr<network::HttpServerAsio> server_;
    std::unique_ptr<boost::asio::signal_set> signals_;
    std::thread thread_;

    mutable std::mutex mutex_;
    Faults faults_;
    std::map<std::string, Upload> uploads_;
    std::vector<LoggedRequest> requests_;
    std::uint64_t next_ticket_ = 1;
    std::uint64_t next_video_ = 1000;
};

} // namespace chunkup::server
