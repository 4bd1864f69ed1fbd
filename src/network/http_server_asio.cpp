#include "chunkup/network/http_server_asio.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <vector>

namespace chunkup {
namespace network {

// ──────────────────────────────────────────────────────────
// HttpConnection Implementation
// ──────────────────────────────────────────────────────────

HttpConnection::HttpConnection(tcp::socket socket, HttpRequestHandler handler)
    : socket_(std::move(socket))
    , handler_(std::move(handler))
    , parser_()
    , buffer_() {
}

void HttpConnection::start() {
    do_read();
}

void HttpConnection::do_read() {
    auto self = shared_from_this();

    socket_.async_read_some(
        asio::buffer(buffer_),
        [this, self](boost::system::error_code ec, size_t bytes_transferred) {
            if (ec) {
                if (ec != asio::error::operation_aborted && ec != asio::error::eof) {
                    spdlog::debug("Read error: {}", ec.message());
                }
                return;
            }

            auto parse_result = parser_.parse(buffer_.data(), bytes_transferred);
            if (parse_result.is_error()) {
                handle_error("Parse error: " + parse_result.error());
                return;
            }

            if (!parse_result.value()) {
                do_read();
                return;
            }

            HttpRequest request = parser_.get_request();
            spdlog::debug("{} {} ({} body bytes)",
                HttpMethodUtils::to_string(request.method),
                request.url,
                request.body.size());

            HttpResponse response;
            if (!handler_) {
                response = create_error_response(HttpStatus::NOT_IMPLEMENTED, "No handler installed");
            } else {
                try {
                    response = handler_(request);
                } catch (const std::exception& e) {
                    spdlog::error("Handler threw exception: {}", e.what());
                    response = create_error_response(HttpStatus::INTERNAL_SERVER_ERROR, "Internal server error");
                }
            }

            do_write(response);
        }
    );
}

void HttpConnection::do_write(const HttpResponse& response) {
    auto self = shared_from_this();

    // Keep the serialized bytes alive until the async write completes
    auto data_ptr = std::make_shared<std::vector<uint8_t>>(response.serialize());

    asio::async_write(
        socket_,
        asio::buffer(*data_ptr),
        [this, self, data_ptr](boost::system::error_code ec, size_t bytes_transferred) {
            if (!ec) {
                spdlog::debug("Sent {} bytes", bytes_transferred);
                boost::system::error_code shutdown_ec;
                socket_.shutdown(tcp::socket::shutdown_both, shutdown_ec);
            } else if (ec != asio::error::operation_aborted) {
                spdlog::debug("Write error: {}", ec.message());
            }
        }
    );
}

void HttpConnection::handle_error(const std::string& message) {
    spdlog::warn("Connection error: {}", message);
    do_write(create_error_response(HttpStatus::BAD_REQUEST, message));
}

HttpResponse HttpConnection::create_error_response(HttpStatus status, const std::string& message) {
    HttpResponse response(status);
    response.set_header("Content-Type", "application/json");
    response.set_header("Connection", "close");
    std::string escaped;
    for (char c : message) {
        if (c == '"' || c == '\\') {
            escaped += '\\';
        }
        escaped += c;
    }
    response.set_body("{\"error\":\"" + escaped + "\"}");
    return response;
}

// ──────────────────────────────────────────────────────────
// HttpServerAsio Implementation
// ──────────────────────────────────────────────────────────

HttpServerAsio::HttpServerAsio(asio::io_context& io_context, uint16_t port, const std::string& address)
    : acceptor_(io_context, tcp::endpoint(asio::ip::make_address(address), port))
    , port_(acceptor_.local_endpoint().port()) {

    spdlog::info("HTTP server listening on {}:{}", address, port_);
    do_accept();
}

void HttpServerAsio::set_handler(HttpRequestHandler handler) {
    handler_ = std::move(handler);
}

void HttpServerAsio::stop() {
    boost::system::error_code ec;
    acceptor_.close(ec);
    if (ec) {
        spdlog::warn("Failed to close acceptor: {}", ec.message());
    }
}

void HttpServerAsio::do_accept() {
    acceptor_.async_accept(
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (ec == asio::error::operation_aborted) {
                return;
            }
            if (!ec) {
                std::make_shared<HttpConnection>(std::move(socket), handler_)->start();
            } else {
                spdlog::error("Accept error: {}", ec.message());
            }
            do_accept();
        }
    );
}

} // namespace network
} // namespace chunkup
