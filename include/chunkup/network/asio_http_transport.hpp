#pragma once

#include "chunkup/network/http_transport.hpp"

#include <chrono>
#include <string>

namespace chunkup::network {

/**
 * @brief HttpTransport over plain TCP using Boost.Asio
 *
 * Every request opens its own connection (Connection: close) and runs a
 * private io_context until the response is parsed or the deadline expires,
 * so one transport may be shared by uploads running on different threads.
 *
 * Only http:// URLs are supported. Requests marked requires_auth get
 * "Authorization: bearer <token>".
 *
 * Usage:
 * ```cpp
 * AsioHttpTransport transport({token, "chunkup/1.0", std::chrono::seconds(30)});
 * HttpRequest request;
 * request.method = HttpMethod::GET;
 * request.url = "http://127.0.0.1:8080/me";
 * auto response = transport.send(request);
 * ```
 */
class AsioHttpTransport : public HttpTransport {
public:
    struct Options {
        std::string access_token;
        std::string user_agent = "chunkup/1.0";
        std::chrono::milliseconds timeout{std::chrono::seconds(60)};
    };

    explicit AsioHttpTransport(Options options);

    Result<HttpResponse> send(const HttpRequest& request) override;

private:
    HttpRequest decorate(const HttpRequest& request) const;

    Options options_;
};

} // namespace chunkup::network
