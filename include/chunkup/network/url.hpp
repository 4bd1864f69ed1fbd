#pragma once

#include "chunkup/core/result.hpp"

#include <cstdint>
#include <string>

namespace chunkup::network {

/**
 * @brief Absolute http URL split into the parts a transport needs
 */
struct Url {
    std::string scheme;   ///< Lower-case, "http" or "https"
    std::string host;
    uint16_t port = 80;
    std::string target;   ///< Path plus query, always starts with '/'

    /// Host header value; the port is omitted when it is the scheme default
    std::string authority() const;

    /// scheme://authority without the target
    std::string origin() const;

    std::string to_string() const { return origin() + target; }
};

Result<Url> parse_url(const std::string& text);

/**
 * @brief Resolve a server-supplied reference against a base URL
 *
 * Absolute references are returned unchanged. References starting with '/'
 * replace the base target. Anything else is appended to the base path.
 */
Result<std::string> resolve_url(const std::string& base, const std::string& reference);

/// Append key=value to the query string of url
std::string append_query(const std::string& url, const std::string& key, const std::string& value);

} // namespace chunkup::network
