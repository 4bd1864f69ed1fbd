#pragma once

#include <cstdint>
#include <cstring>  // For _stricmp on Windows, strcasecmp on Unix
#include <optional>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

#ifndef _WIN32
#include <strings.h>
#endif

namespace chunkup {
namespace network {

/**
 * @brief HTTP request methods used by the upload protocol
 *
 * DELETE is spelled DELETE_METHOD to avoid the Windows macro of the same name.
 */
enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE_METHOD,
    HEAD,
    OPTIONS,
    PATCH,
    UNKNOWN
};

enum class HttpVersion {
    HTTP_1_0,
    HTTP_1_1,
    UNKNOWN
};

/**
 * @brief Status codes the upload client and the mock server care about
 *
 * 308 is used by resumable upload endpoints as "Resume Incomplete": the
 * server holds part of the payload and reports how much in a Range header.
 */
enum class HttpStatus {
    OK = 200,
    CREATED = 201,
    NO_CONTENT = 204,
    RESUME_INCOMPLETE = 308,
    BAD_REQUEST = 400,
    UNAUTHORIZED = 401,
    FORBIDDEN = 403,
    NOT_FOUND = 404,
    METHOD_NOT_ALLOWED = 405,
    CONFLICT = 409,
    INTERNAL_SERVER_ERROR = 500,
    NOT_IMPLEMENTED = 501,
    SERVICE_UNAVAILABLE = 503
};

using HeaderMap = std::unordered_map<std::string, std::string>;

namespace detail {

// Cross-platform case-insensitive string comparison
inline int strcasecmp_cross_platform(const char* s1, const char* s2) {
#ifdef _WIN32
    return _stricmp(s1, s2);
#else
    return strcasecmp(s1, s2);
#endif
}

/**
 * @brief Case-insensitive header lookup (RFC 7230 field names)
 */
inline std::optional<std::string> find_header(const HeaderMap& headers, const std::string& name) {
    for (const auto& [key, value] : headers) {
        if (strcasecmp_cross_platform(key.c_str(), name.c_str()) == 0) {
            return value;
        }
    }
    return std::nullopt;
}

} // namespace detail

/**
 * @brief Helper functions for HTTP method conversions
 */
class HttpMethodUtils {
public:
    static HttpMethod from_string(const std::string& method_str) {
        if (method_str == "GET") return HttpMethod::GET;
        if (method_str == "POST") return HttpMethod::POST;
        if (method_str == "PUT") return HttpMethod::PUT;
        if (method_str == "DELETE") return HttpMethod::DELETE_METHOD;
        if (method_str == "HEAD") return HttpMethod::HEAD;
        if (method_str == "OPTIONS") return HttpMethod::OPTIONS;
        if (method_str == "PATCH") return HttpMethod::PATCH;
        return HttpMethod::UNKNOWN;
    }

    static std::string to_string(HttpMethod method) {
        switch (method) {
            case HttpMethod::GET: return "GET";
            case HttpMethod::POST: return "POST";
            case HttpMethod::PUT: return "PUT";
            case HttpMethod::DELETE_METHOD: return "DELETE";
            case HttpMethod::HEAD: return "HEAD";
            case HttpMethod::OPTIONS: return "OPTIONS";
            case HttpMethod::PATCH: return "PATCH";
            default: return "UNKNOWN";
        }
    }
};

/**
 * @brief An outgoing (client) or incoming (server) HTTP request
 *
 * On the client side `url` is absolute ("http://host:port/path?query");
 * the transport splits it into host and request target. On the server side
 * the parser fills `url` with the request target as received.
 *
 * `requires_auth` tells the transport whether to attach the account's
 * Authorization header. Upload-link requests leave it off because the link
 * itself is pre-authorized by the ticket.
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::UNKNOWN;
    std::string url;
    HttpVersion version = HttpVersion::HTTP_1_1;
    HeaderMap headers;
    std::vector<uint8_t> body;
    bool requires_auth = true;

    std::optional<std::string> find_header(const std::string& name) const {
        return detail::find_header(headers, name);
    }

    /**
     * @brief Get a header value (case-insensitive lookup)
     *
     * @return Header value if found, empty string otherwise
     */
    std::string get_header(const std::string& name) const {
        return find_header(name).value_or("");
    }

    bool has_header(const std::string& name) const {
        return find_header(name).has_value();
    }

    void set_header(const std::string& name, const std::string& value) {
        headers[name] = value;
    }

    std::string body_as_string() const {
        return std::string(body.begin(), body.end());
    }

    /**
     * @brief Serialize to HTTP/1.1 wire format
     *
     * @param target Request target (path and query) for the request line
     * @param host Value for the Host header
     */
    std::vector<uint8_t> serialize(const std::string& target, const std::string& host) const {
        std::ostringstream oss;
        oss << HttpMethodUtils::to_string(method) << " " << target << " HTTP/1.1\r\n";
        oss << "Host: " << host << "\r\n";
        for (const auto& [name, value] : headers) {
            oss << name << ": " << value << "\r\n";
        }
        if (!has_header("Content-Length")) {
            oss << "Content-Length: " << body.size() << "\r\n";
        }
        oss << "\r\n";

        std::string header_str = oss.str();
        std::vector<uint8_t> result(header_str.begin(), header_str.end());
        result.insert(result.end(), body.begin(), body.end());
        return result;
    }
};

/**
 * @brief An HTTP response as received by the client or produced by the server
 */
struct HttpResponse {
    HttpVersion version = HttpVersion::HTTP_1_1;
    int status_code = 200;
    std::string reason_phrase;
    HeaderMap headers;
    std::vector<uint8_t> body;

    HttpResponse() = default;

    explicit HttpResponse(HttpStatus status)
        : status_code(static_cast<int>(status))
        , reason_phrase(get_reason_phrase(status)) {
    }

    bool is_success() const {
        return status_code >= 200 && status_code < 300;
    }

    std::optional<std::string> find_header(const std::string& name) const {
        return detail::find_header(headers, name);
    }

    std::string get_header(const std::string& name) const {
        return find_header(name).value_or("");
    }

    bool has_header(const std::string& name) const {
        return find_header(name).has_value();
    }

    void set_header(const std::string& name, const std::string& value) {
        headers[name] = value;
    }

    void set_body(const std::string& content) {
        body.assign(content.begin(), content.end());
        headers["Content-Length"] = std::to_string(body.size());
    }

    void set_body(const std::vector<uint8_t>& data) {
        body = data;
        headers["Content-Length"] = std::to_string(body.size());
    }

    std::string body_as_string() const {
        return std::string(body.begin(), body.end());
    }

    /**
     * @brief Serialize the response to bytes for transmission
     *
     * A Content-Length header is always emitted so clients can frame the body.
     */
    std::vector<uint8_t> serialize() const {
        std::ostringstream oss;
        oss << version_to_string(version) << " "
            << status_code << " "
            << reason_phrase << "\r\n";

        for (const auto& [name, value] : headers) {
            oss << name << ": " << value << "\r\n";
        }
        if (!has_header("Content-Length")) {
            oss << "Content-Length: " << body.size() << "\r\n";
        }
        oss << "\r\n";

        std::string header_str = oss.str();
        std::vector<uint8_t> result(header_str.begin(), header_str.end());
        result.insert(result.end(), body.begin(), body.end());
        return result;
    }

    static std::string get_reason_phrase(HttpStatus status) {
        switch (status) {
            case HttpStatus::OK: return "OK";
            case HttpStatus::CREATED: return "Created";
            case HttpStatus::NO_CONTENT: return "No Content";
            case HttpStatus::RESUME_INCOMPLETE: return "Resume Incomplete";
            case HttpStatus::BAD_REQUEST: return "Bad Request";
            case HttpStatus::UNAUTHORIZED: return "Unauthorized";
            case HttpStatus::FORBIDDEN: return "Forbidden";
            case HttpStatus::NOT_FOUND: return "Not Found";
            case HttpStatus::METHOD_NOT_ALLOWED: return "Method Not Allowed";
            case HttpStatus::CONFLICT: return "Conflict";
            case HttpStatus::INTERNAL_SERVER_ERROR: return "Internal Server Error";
            case HttpStatus::NOT_IMPLEMENTED: return "Not Implemented";
            case HttpStatus::SERVICE_UNAVAILABLE: return "Service Unavailable";
            default: return "Unknown";
        }
    }

    static std::string version_to_string(HttpVersion version) {
        switch (version) {
            case HttpVersion::HTTP_1_0: return "HTTP/1.0";
            case HttpVersion::HTTP_1_1: return "HTTP/1.1";
            default: return "HTTP/1.1";
        }
    }
};

} // namespace network
} // namespace chunkup
