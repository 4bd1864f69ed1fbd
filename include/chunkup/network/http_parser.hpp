#pragma once

#include "chunkup/core/result.hpp"
#include "chunkup/network/http_types.hpp"

#include <cctype>
#include <charconv>
#include <cstddef>
#include <string>
#include <system_error>

namespace chunkup {
namespace network {

/**
 * @brief State machine states for HTTP message parsing
 *
 * HTTP/1.1 message format:
 * start-line CRLF                  <- request line or status line
 * Header-Name: Header-Value CRLF   <- Headers (multiple)
 * CRLF                             <- Empty line
 * [Body]                           <- Content-Length, chunked, or until EOF
 */
enum class ParseState {
    START_LINE,
    HEADER_NAME,
    HEADER_VALUE,
    BODY,
    BODY_UNTIL_EOF,
    CHUNK_SIZE,
    CHUNK_DATA,
    CHUNK_DATA_END,
    CHUNK_TRAILER,
    COMPLETE,
    PARSE_ERROR
};

namespace detail {

/**
 * @brief Incremental HTTP/1.1 message parser shared by requests and responses
 *
 * Data can be fed in arbitrary pieces as it arrives from the socket. The
 * derived parser handles the start line and decides whether a message
 * without framing headers carries a body.
 *
 * Derived must provide:
 *   bool on_start_line(const std::string& line);
 *   bool body_until_eof() const;
 */
template<typename Derived, typename Message>
class MessageParser {
public:
    /**
     * @brief Feed incoming bytes to the parser
     *
     * @return true once the message is complete, false if more data is needed,
     *         or an error describing the malformed input
     */
    Result<bool> parse(const char* data, size_t len) {
        for (size_t i = 0; i < len; ++i) {
            const char c = data[i];
            if (c == '\n') {
                line_++;
            }

            bool ok = true;
            switch (state_) {
                case ParseState::START_LINE:
                    ok = parse_start_line(c);
                    break;
                case ParseState::HEADER_NAME:
                    ok = parse_header_name(c);
                    break;
                case ParseState::HEADER_VALUE:
                    ok = parse_header_value(c);
                    break;
                case ParseState::BODY:
                    parse_body(c);
                    break;
                case ParseState::BODY_UNTIL_EOF:
                    message_.body.push_back(static_cast<uint8_t>(c));
                    break;
                case ParseState::CHUNK_SIZE:
                    ok = parse_chunk_size(c);
                    break;
                case ParseState::CHUNK_DATA:
                    parse_chunk_data(c);
                    break;
                case ParseState::CHUNK_DATA_END:
                    ok = parse_chunk_data_end(c);
                    break;
                case ParseState::CHUNK_TRAILER:
                    ok = parse_chunk_trailer(c);
                    break;
                case ParseState::COMPLETE:
                    return Ok(true);
                case ParseState::PARSE_ERROR:
                    return Err("Parser in error state");
            }

            if (!ok) {
                state_ = ParseState::PARSE_ERROR;
                return Err(error_ + " at line " + std::to_string(line_));
            }
            if (state_ == ParseState::COMPLETE) {
                return Ok(true);
            }
        }
        return Ok(false);
    }

    /**
     * @brief Signal that the peer closed the connection
     *
     * Completes a message whose body is delimited by connection close;
     * any other unfinished message is an error.
     */
    Result<bool> finish() {
        if (state_ == ParseState::COMPLETE) {
            return Ok(true);
        }
        if (state_ == ParseState::BODY_UNTIL_EOF) {
            state_ = ParseState::COMPLETE;
            return Ok(true);
        }
        state_ = ParseState::PARSE_ERROR;
        return Err("Connection closed before message was complete");
    }

    bool is_complete() const { return state_ == ParseState::COMPLETE; }
    ParseState state() const { return state_; }

    void reset() {
        state_ = ParseState::START_LINE;
        message_ = Message();
        buffer_.clear();
        current_header_name_.clear();
        error_.clear();
        remaining_ = 0;
        line_ = 1;
        last_char_was_cr_ = false;
    }

protected:
    MessageParser() { reset(); }

    Message message_;
    std::string error_;

private:
    ParseState state_;
    std::string buffer_;
    std::string current_header_name_;
    size_t remaining_;  // Body or chunk bytes still expected
    size_t line_;
    bool last_char_was_cr_;

    Derived& derived() { return static_cast<Derived&>(*this); }

    // Returns true when c completes a CRLF-terminated line held in buffer_
    bool at_line_end(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return false;
        }
        if (c == '\n' && last_char_was_cr_) {
            last_char_was_cr_ = false;
            return true;
        }
        last_char_was_cr_ = false;
        buffer_ += c;
        return false;
    }

    bool parse_start_line(char c) {
        if (!at_line_end(c)) {
            return true;
        }
        const std::string line = buffer_;
        buffer_.clear();
        if (!derived().on_start_line(line)) {
            if (error_.empty()) {
                error_ = "Malformed start line";
            }
            return false;
        }
        state_ = ParseState::HEADER_NAME;
        return true;
    }

    bool parse_header_name(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }

        if (c == '\n' && last_char_was_cr_) {
            last_char_was_cr_ = false;
            if (!buffer_.empty()) {
                error_ = "Header line without colon";
                return false;
            }
            return begin_body();
        }

        last_char_was_cr_ = false;

        if (c == ':') {
            if (buffer_.empty()) {
                error_ = "Empty header name";
                return false;
            }
            current_header_name_ = buffer_;
            buffer_.clear();
            state_ = ParseState::HEADER_VALUE;
            return true;
        }

        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') {
            error_ = "Invalid character in header name";
            return false;
        }

        buffer_ += c;
        return true;
    }

    bool parse_header_value(char c) {
        // Skip leading whitespace after colon
        if (buffer_.empty() && (c == ' ' || c == '\t')) {
            return true;
        }
        if (!at_line_end(c)) {
            return true;
        }
        while (!buffer_.empty() && (buffer_.back() == ' ' || buffer_.back() == '\t')) {
            buffer_.pop_back();
        }
        message_.headers[current_header_name_] = buffer_;
        buffer_.clear();
        current_header_name_.clear();
        state_ = ParseState::HEADER_NAME;
        return true;
    }

    bool begin_body() {
        const auto transfer_encoding = message_.find_header("Transfer-Encoding");
        if (transfer_encoding && transfer_encoding->find("chunked") != std::string::npos) {
            state_ = ParseState::CHUNK_SIZE;
            return true;
        }

        const auto content_length = message_.find_header("Content-Length");
        if (content_length) {
            const std::string& text = *content_length;
            size_t length = 0;
            const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), length);
            if (ec != std::errc() || ptr != text.data() + text.size()) {
                error_ = "Invalid Content-Length: " + text;
                return false;
            }
            if (length == 0) {
                state_ = ParseState::COMPLETE;
                return true;
            }
            message_.body.reserve(length);
            remaining_ = length;
            state_ = ParseState::BODY;
            return true;
        }

        state_ = derived().body_until_eof() ? ParseState::BODY_UNTIL_EOF : ParseState::COMPLETE;
        return true;
    }

    void parse_body(char c) {
        message_.body.push_back(static_cast<uint8_t>(c));
        if (--remaining_ == 0) {
            state_ = ParseState::COMPLETE;
        }
    }

    bool parse_chunk_size(char c) {
        if (!at_line_end(c)) {
            return true;
        }
        std::string size_text = buffer_.substr(0, buffer_.find(';'));
        buffer_.clear();
        while (!size_text.empty() && size_text.back() == ' ') {
            size_text.pop_back();
        }
        size_t size = 0;
        const auto [ptr, ec] = std::from_chars(size_text.data(), size_text.data() + size_text.size(), size, 16);
        if (size_text.empty() || ec != std::errc() || ptr != size_text.data() + size_text.size()) {
            error_ = "Invalid chunk size: " + size_text;
            return false;
        }
        if (size == 0) {
            state_ = ParseState::CHUNK_TRAILER;
            return true;
        }
        remaining_ = size;
        state_ = ParseState::CHUNK_DATA;
        return true;
    }

    void parse_chunk_data(char c) {
        message_.body.push_back(static_cast<uint8_t>(c));
        if (--remaining_ == 0) {
            state_ = ParseState::CHUNK_DATA_END;
        }
    }

    bool parse_chunk_data_end(char c) {
        if (at_line_end(c)) {
            if (!buffer_.empty()) {
                error_ = "Chunk data longer than declared size";
                return false;
            }
            state_ = ParseState::CHUNK_SIZE;
        }
        return true;
    }

    bool parse_chunk_trailer(char c) {
        if (!at_line_end(c)) {
            return true;
        }
        // Trailer fields are ignored; an empty line ends the message
        if (buffer_.empty()) {
            state_ = ParseState::COMPLETE;
        }
        buffer_.clear();
        return true;
    }
};

inline bool parse_version_token(const std::string& token, HttpVersion& version) {
    if (token == "HTTP/1.1") {
        version = HttpVersion::HTTP_1_1;
        return true;
    }
    if (token == "HTTP/1.0") {
        version = HttpVersion::HTTP_1_0;
        return true;
    }
    return false;
}

} // namespace detail

/**
 * @brief Server-side parser for incoming requests
 *
 * Usage:
 * ```cpp
 * HttpRequestParser parser;
 * auto result = parser.parse(buffer.data(), bytes_read);
 * if (result.is_ok() && result.value()) {
 *     HttpRequest request = parser.get_request();
 * }
 * ```
 */
class HttpRequestParser : public detail::MessageParser<HttpRequestParser, HttpRequest> {
public:
    HttpRequest get_request() const { return message_; }

    bool on_start_line(const std::string& line) {
        const auto first_space = line.find(' ');
        const auto last_space = line.rfind(' ');
        if (first_space == std::string::npos || first_space == last_space) {
            error_ = "Malformed request line";
            return false;
        }

        message_.method = HttpMethodUtils::from_string(line.substr(0, first_space));
        if (message_.method == HttpMethod::UNKNOWN) {
            error_ = "Unknown HTTP method";
            return false;
        }

        message_.url = line.substr(first_space + 1, last_space - first_space - 1);
        if (message_.url.empty()) {
            error_ = "Empty request target";
            return false;
        }

        if (!detail::parse_version_token(line.substr(last_space + 1), message_.version)) {
            error_ = "Unknown HTTP version";
            return false;
        }
        return true;
    }

    // Requests without Content-Length or chunked encoding have no body
    bool body_until_eof() const { return false; }
};

/**
 * @brief Client-side parser for server responses
 *
 * Responses without framing headers are read until the server closes the
 * connection; call finish() when the socket reports EOF.
 */
class HttpResponseParser : public detail::MessageParser<HttpResponseParser, HttpResponse> {
public:
    HttpResponse get_response() const { return message_; }

    bool on_start_line(const std::string& line) {
        const auto first_space = line.find(' ');
        if (first_space == std::string::npos) {
            error_ = "Malformed status line";
            return false;
        }
        if (!detail::parse_version_token(line.substr(0, first_space), message_.version)) {
            error_ = "Unknown HTTP version";
            return false;
        }

        const auto code_end = line.find(' ', first_space + 1);
        const std::string code = line.substr(first_space + 1,
            code_end == std::string::npos ? std::string::npos : code_end - first_space - 1);
        int status = 0;
        const auto [ptr, ec] = std::from_chars(code.data(), code.data() + code.size(), status);
        if (code.size() != 3 || ec != std::errc() || ptr != code.data() + code.size()) {
            error_ = "Invalid status code: " + code;
            return false;
        }
        message_.status_code = status;
        message_.reason_phrase = code_end == std::string::npos ? "" : line.substr(code_end + 1);
        return true;
    }

    bool body_until_eof() const {
        const int status = message_.status_code;
        return !(status < 200 || status == 204 || status == 304);
    }
};

} // namespace network
} // namespace chunkup
