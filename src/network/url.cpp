#include "chunkup/network/url.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <system_error>

namespace chunkup::network {
namespace {

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

uint16_t default_port(const std::string& scheme) {
    return scheme == "https" ? 443 : 80;
}

} // namespace

std::string Url::authority() const {
    if (port == default_port(scheme)) {
        return host;
    }
    return host + ":" + std::to_string(port);
}

std::string Url::origin() const {
    return scheme + "://" + authority();
}

Result<Url> parse_url(const std::string& text) {
    const auto scheme_end = text.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        return Err(std::string("URL has no scheme: ") + text);
    }

    Url url;
    url.scheme = to_lower(text.substr(0, scheme_end));
    if (url.scheme != "http" && url.scheme != "https") {
        return Err(std::string("Unsupported URL scheme: ") + url.scheme);
    }
    url.port = default_port(url.scheme);

    const auto authority_begin = scheme_end + 3;
    const auto target_begin = text.find_first_of("/?#", authority_begin);
    const std::string authority = text.substr(authority_begin,
        target_begin == std::string::npos ? std::string::npos : target_begin - authority_begin);

    if (authority.empty()) {
        return Err(std::string("URL has no host: ") + text);
    }
    if (authority.find('@') != std::string::npos) {
        return Err(std::string("URL user info is not supported: ") + text);
    }

    const auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
        url.host = authority.substr(0, colon);
        const std::string port_text = authority.substr(colon + 1);
        unsigned int port = 0;
        const auto [ptr, ec] = std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
        if (port_text.empty() || ec != std::errc() || ptr != port_text.data() + port_text.size() ||
            port == 0 || port > 65535) {
            return Err(std::string("Invalid port in URL: ") + text);
        }
        url.port = static_cast<uint16_t>(port);
    } else {
        url.host = authority;
    }

    if (url.host.empty()) {
        return Err(std::string("URL has no host: ") + text);
    }

    std::string target = target_begin == std::string::npos ? "/" : text.substr(target_begin);
    const auto fragment = target.find('#');
    if (fragment != std::string::npos) {
        target.erase(fragment);
    }
    if (target.empty() || target.front() != '/') {
        target.insert(target.begin(), '/');
    }
    url.target = std::move(target);
    return Ok(std::move(url));
}

Result<std::string> resolve_url(const std::string& base, const std::string& reference) {
    if (reference.find("://") != std::string::npos) {
        return Ok(reference);
    }

    auto parsed = parse_url(base);
    if (parsed.is_error()) {
        return Err(parsed.error());
    }
    const Url& base_url = parsed.value();

    if (!reference.empty() && reference.front() == '/') {
        return Ok(base_url.origin() + reference);
    }

    std::string path = base_url.target.substr(0, base_url.target.find('?'));
    if (path.empty() || path.back() != '/') {
        path += '/';
    }
    return Ok(base_url.origin() + path + reference);
}

std::string append_query(const std::string& url, const std::string& key, const std::string& value) {
    const char separator = url.find('?') == std::string::npos ? '?' : '&';
    return url + separator + key + "=" + value;
}

} // namespace chunkup::network
