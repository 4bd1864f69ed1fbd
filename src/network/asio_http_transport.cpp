#include "chunkup/network/asio_http_transport.hpp"

#include "chunkup/network/http_parser.hpp"
#include "chunkup/network/url.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <spdlog/spdlog.h>

#include <array>
#include <optional>
#include <utility>
#include <vector>

namespace chunkup::network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace {

/**
 * @brief One request/response exchange on a private io_context
 *
 * resolve -> connect -> write -> read until the parser reports completion.
 * The first failure wins; later callbacks (usually operation_aborted after
 * cancel()) do not overwrite it.
 */
class Exchange {
public:
    Exchange(asio::io_context& io_context, Url url, std::vector<uint8_t> payload)
        : resolver_(io_context)
        , socket_(io_context)
        , url_(std::move(url))
        , payload_(std::move(payload)) {
    }

    void start() {
        resolver_.async_resolve(
            url_.host,
            std::to_string(url_.port),
            [this](boost::system::error_code ec, tcp::resolver::results_type results) {
                if (ec) {
                    fail("Failed to resolve " + url_.host + ": " + ec.message());
                    return;
                }
                do_connect(results);
            }
        );
    }

    void cancel() {
        resolver_.cancel();
        boost::system::error_code ignored;
        socket_.close(ignored);
    }

    bool done() const { return done_; }
    const std::optional<std::string>& error() const { return error_; }
    HttpResponse response() const { return parser_.get_response(); }

private:
    void do_connect(const tcp::resolver::results_type& endpoints) {
        asio::async_connect(
            socket_,
            endpoints,
            [this](boost::system::error_code ec, const tcp::endpoint&) {
                if (ec) {
                    fail("Failed to connect to " + url_.authority() + ": " + ec.message());
                    return;
                }
                do_write();
            }
        );
    }

    void do_write() {
        asio::async_write(
            socket_,
            asio::buffer(payload_),
            [this](boost::system::error_code ec, size_t bytes_transferred) {
                if (ec) {
                    fail("Failed to send request: " + ec.message());
                    return;
                }
                spdlog::debug("Sent {} bytes to {}", bytes_transferred, url_.authority());
                do_read();
            }
        );
    }

    void do_read() {
        socket_.async_read_some(
            asio::buffer(buffer_),
            [this](boost::system::error_code ec, size_t bytes_transferred) {
                if (ec == asio::error::eof) {
                    auto finished = parser_.finish();
                    if (finished.is_error()) {
                        fail(finished.error());
                        return;
                    }
                    complete();
                    return;
                }
                if (ec) {
                    fail("Failed to receive response: " + ec.message());
                    return;
                }

                auto parse_result = parser_.parse(buffer_.data(), bytes_transferred);
                if (parse_result.is_error()) {
                    fail("Malformed response: " + parse_result.error());
                    return;
                }
                if (parse_result.value()) {
                    complete();
                    return;
                }
                do_read();
            }
        );
    }

    void complete() {
        if (error_) {
            return;
        }
        done_ = true;
        boost::system::error_code ignored;
        socket_.shutdown(tcp::socket::shutdown_both, ignored);
        socket_.close(ignored);
    }

    void fail(std::string message) {
        if (!error_ && !done_) {
            error_ = std::move(message);
        }
    }

    tcp::resolver resolver_;
    tcp::socket socket_;
    Url url_;
    std::vector<uint8_t> payload_;
    std::array<char, 8192> buffer_{};
    HttpResponseParser parser_;
    bool done_ = false;
    std::optional<std::string> error_;
};

} // namespace

AsioHttpTransport::AsioHttpTransport(Options options)
    : options_(std::move(options)) {
}

Result<HttpResponse> AsioHttpTransport::send(const HttpRequest& request) {
    auto parsed = parse_url(request.url);
    if (parsed.is_error()) {
        return Err(parsed.error());
    }
    const Url url = parsed.value();
    if (url.scheme != "http") {
        return Err(std::string("AsioHttpTransport supports plain http only: ") + request.url);
    }

    const HttpRequest decorated = decorate(request);
    const auto method = HttpMethodUtils::to_string(request.method);

    asio::io_context io_context;
    Exchange exchange(io_context, url, decorated.serialize(url.target, url.authority()));
    exchange.start();
    io_context.run_for(options_.timeout);

    if (!exchange.done() && !exchange.error()) {
        exchange.cancel();
        io_context.restart();
        io_context.run();
        spdlog::warn("{} {} timed out after {} ms", method, request.url, options_.timeout.count());
        return Err(method + " " + request.url + " timed out after " +
                   std::to_string(options_.timeout.count()) + " ms");
    }

    if (exchange.error()) {
        spdlog::debug("{} {} failed: {}", method, request.url, *exchange.error());
        return Err(*exchange.error());
    }

    HttpResponse response = exchange.response();
    spdlog::debug("{} {} -> {} ({} body bytes)", method, request.url, response.status_code, response.body.size());
    return Ok(std::move(response));
}

HttpRequest AsioHttpTransport::decorate(const HttpRequest& request) const {
    HttpRequest decorated = request;
    decorated.set_header("Connection", "close");
    if (!decorated.has_header("User-Agent")) {
        decorated.set_header("User-Agent", options_.user_agent);
    }
    if (request.requires_auth) {
        if (!options_.access_token.empty()) {
            decorated.set_header("Authorization", "bearer " + options_.access_token);
        }
        if (!decorated.has_header("Accept")) {
            decorated.set_header("Accept", "application/json");
        }
    }
    return decorated;
}

} // namespace chunkup::network
