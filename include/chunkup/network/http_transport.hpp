#pragma once

#include "chunkup/core/result.hpp"
#include "chunkup/network/http_types.hpp"

#include <string>

namespace chunkup::network {

/**
 * @brief Executes one HTTP request and returns the complete response
 *
 * Blocking from the caller's point of view. Any HTTP status, including
 * 4xx/5xx, is a successful result; the error side is reserved for faults
 * that prevented a response from being received (DNS, connect, timeout,
 * malformed response).
 *
 * Implementations attach the account's credentials only when
 * request.requires_auth is set.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual Result<HttpResponse> send(const HttpRequest& request) = 0;
};

} // namespace chunkup::network
