#pragma once

#include "chunkup/network/http_transport.hpp"
#include "chunkup/network/url.hpp"
#include "chunkup/server/mock_upload_server.hpp"

#include <deque>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace chunkup::test {

inline network::HttpResponse make_response(int status_code,
                                           network::HeaderMap headers = {},
                                           const std::string& body = {}) {
    network::HttpResponse response;
    response.status_code = status_code;
    response.headers = std::move(headers);
    if (!body.empty()) {
        response.set_body(body);
    }
    return response;
}

/**
 * @brief Replays queued responses in order and records every request
 *
 * Running out of responses is reported as a transport error.
 */
class ScriptedTransport : public network::HttpTransport {
public:
    void push(network::HttpResponse response) {
        script_.emplace_back(std::move(response));
    }

    void push_error(std::string message) {
        script_.emplace_back(std::move(message));
    }

    Result<network::HttpResponse> send(const network::HttpRequest& request) override {
        requests.push_back(request);
        if (script_.empty()) {
            return Err("No scripted response for " + request.url);
        }
        auto next = std::move(script_.front());
        script_.pop_front();
        if (auto* error = std::get_if<std::string>(&next)) {
            return Err(*error);
        }
        return Ok(std::get<network::HttpResponse>(std::move(next)));
    }

    std::size_t remaining() const { return script_.size(); }

    std::vector<network::HttpRequest> requests;

private:
    std::deque<std::variant<network::HttpResponse, std::string>> script_;
};

/**
 * @brief Routes requests straight into a MockUploadServer without sockets
 *
 * The absolute URL is reduced to its target, as the server would see it.
 * fail_next() makes the next requests fail as transport errors before they
 * reach the server.
 */
class MockServerTransport : public network::HttpTransport {
public:
    explicit MockServerTransport(server::MockUploadServer& server) : server_(server) {}

    void fail_next(std::size_t count) { failures_ = count; }

    Result<network::HttpResponse> send(const network::HttpRequest& request) override {
        requests.push_back(request);
        if (failures_ > 0) {
            failures_--;
            return Err("Connection reset by peer");
        }

        auto url = network::parse_url(request.url);
        if (url.is_error()) {
            return Err(url.error());
        }
        network::HttpRequest routed = request;
        routed.url = url.value().target;
        return Ok(server_.handle(routed));
    }

    std::vector<network::HttpRequest> requests;

private:
    server::MockUploadServer& server_;
    std::size_t failures_ = 0;
};

} // namespace chunkup::test
