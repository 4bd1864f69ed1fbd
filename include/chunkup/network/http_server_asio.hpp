#pragma once

#include "chunkup/core/result.hpp"
#include "chunkup/network/http_parser.hpp"
#include "chunkup/network/http_types.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <array>
#include <functional>
#include <memory>
#include <string>

namespace chunkup {
namespace network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

using HttpRequestHandler = std::function<HttpResponse(const HttpRequest&)>;

/**
 * @brief Per-connection handler for async HTTP requests
 *
 * Uses enable_shared_from_this to keep the connection alive while async
 * operations are pending. One request per connection; the socket is shut
 * down after the response is written.
 */
class HttpConnection : public std::enable_shared_from_this<HttpConnection> {
public:
    HttpConnection(tcp::socket socket, HttpRequestHandler handler);

    void start();

private:
    void do_read();
    void do_write(const HttpResponse& response);
    void handle_error(const std::string& message);

    static HttpResponse create_error_response(HttpStatus status, const std::string& message);

    tcp::socket socket_;
    HttpRequestHandler handler_;
    HttpRequestParser parser_;
    std::array<char, 8192> buffer_;
};

/**
 * @brief Event-driven HTTP server on a caller-owned io_context
 *
 * Binds to 127.0.0.1 by default. Pass port 0 to let the OS pick a free
 * port and read it back with get_port().
 *
 * Usage:
 * ```cpp
 * asio::io_context io_context;
 * HttpServerAsio server(io_context, 0);
 * server.set_handler([](const HttpRequest& req) {
 *     return HttpResponse(HttpStatus::OK);
 * });
 * io_context.run();
 * ```
 */
class HttpServerAsio {
public:
    HttpServerAsio(asio::io_context& io_context, uint16_t port, const std::string& address = "127.0.0.1");

    void set_handler(HttpRequestHandler handler);

    uint16_t get_port() const { return port_; }

    /// Stop accepting; connections already in flight finish on their own
    void stop();

private:
    void do_accept();

    tcp::acceptor acceptor_;
    HttpRequestHandler handler_;
    uint16_t port_;
};

} // namespace network
} // namespace chunkup
