#pragma once

#include "http_types.hpp"
#include "bitsd/core/result.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstddef>
#include <limits>
#include <string>

namespace bitsd {
namespace network {

/**
 * @brief State machine states for HTTP request parsing
 *
 * HTTP Request Format:
 * METHOD SP URL SP VERSION CRLF    <- Request line
 * Header-Name: Header-Value CRLF   <- Headers (multiple)
 * CRLF                             <- Empty line
 * [Body]                           <- Content-Length bytes
 */
enum class ParseState {
    METHOD,
    URL,
    VERSION,
    HEADER_NAME,
    HEADER_VALUE,
    BODY,
    COMPLETE,
    PARSE_ERROR      // renamed to avoid Windows macro conflict
};

/**
 * @brief Parse failure with the status the connection should answer with
 */
struct ParseError {
    HttpStatus status = HttpStatus::BAD_REQUEST;
    std::string message;
};

/**
 * @brief Incremental HTTP/1.x request parser
 *
 * Data can be fed in arbitrary chunks as it arrives from the socket. The
 * parser stops at the end of one request; bytes_consumed() tells the caller
 * how much of the last chunk belonged to it, so pipelined bytes that follow
 * can be fed again after reset().
 *
 * Usage example:
 * ```cpp
 * HttpParser parser(max_body);
 * auto result = parser.parse(data, len);
 * if (result.is_error()) {
 *     // answer with result.error().status
 * } else if (result.value()) {
 *     HttpRequest request = parser.take_request();
 * }
 * ```
 */
class HttpParser {
public:
    static constexpr std::size_t kDefaultMaxBodySize = 100u * 1024u * 1024u;
    static constexpr std::size_t kMaxHeaderBytes = 64u * 1024u;

    explicit HttpParser(std::size_t max_body_size = kDefaultMaxBodySize)
        : max_body_size_(max_body_size) {
        reset();
    }

    /**
     * @brief Feed incoming bytes
     *
     * @return true when a full request is available, false when more data is
     *         needed, or a ParseError for malformed input
     */
    Result<bool, ParseError> parse(const char* data, size_t len) {
        consumed_ = 0;
        while (consumed_ < len) {
            if (state_ == ParseState::COMPLETE) {
                return Ok<bool, ParseError>(true);
            }
            if (state_ == ParseState::PARSE_ERROR) {
                return fail(HttpStatus::BAD_REQUEST, "Parser in error state");
            }

            if (state_ == ParseState::BODY) {
                const size_t wanted = expected_body_ - request_.body.size();
                const size_t take = std::min(wanted, len - consumed_);
                request_.body.insert(request_.body.end(),
                                     reinterpret_cast<const uint8_t*>(data + consumed_),
                                     reinterpret_cast<const uint8_t*>(data + consumed_ + take));
                consumed_ += take;
                if (request_.body.size() == expected_body_) {
                    state_ = ParseState::COMPLETE;
                }
                continue;
            }

            char c = data[consumed_++];
            if (++header_bytes_ > kMaxHeaderBytes) {
                return fail(HttpStatus::BAD_REQUEST, "Request head too large");
            }
            if (c == '\n') {
                line_++;
            }

            bool ok = true;
            switch (state_) {
                case ParseState::METHOD: ok = parse_method(c); break;
                case ParseState::URL: ok = parse_url(c); break;
                case ParseState::VERSION: ok = parse_version(c); break;
                case ParseState::HEADER_NAME: ok = parse_header_name(c); break;
                case ParseState::HEADER_VALUE: ok = parse_header_value(c); break;
                default: break;
            }

            if (!ok) {
                if (state_ == ParseState::PARSE_ERROR) {
                    return Err<bool, ParseError>(error_);
                }
                return fail(HttpStatus::BAD_REQUEST,
                            "Malformed " + describe(state_) + " at line " + std::to_string(line_));
            }
        }

        return Ok<bool, ParseError>(state_ == ParseState::COMPLETE);
    }

    /**
     * @brief Number of bytes of the last parse() call that were used
     */
    size_t bytes_consumed() const { return consumed_; }

    const HttpRequest& get_request() const { return request_; }

    /**
     * @brief Move the parsed request out (only valid after completion)
     */
    HttpRequest take_request() { return std::move(request_); }

    bool is_complete() const { return state_ == ParseState::COMPLETE; }

    void reset() {
        state_ = ParseState::METHOD;
        request_ = HttpRequest();
        buffer_.clear();
        current_header_name_.clear();
        expected_body_ = 0;
        header_bytes_ = 0;
        consumed_ = 0;
        line_ = 1;
        last_char_was_cr_ = false;
        error_ = ParseError{};
    }

private:
    ParseState state_;
    HttpRequest request_;
    std::string buffer_;
    std::string current_header_name_;
    size_t max_body_size_;
    size_t expected_body_;
    size_t header_bytes_;
    size_t consumed_;
    size_t line_;
    bool last_char_was_cr_;
    ParseError error_;

    Result<bool, ParseError> fail(HttpStatus status, std::string message) {
        state_ = ParseState::PARSE_ERROR;
        error_ = ParseError{status, std::move(message)};
        return Err<bool, ParseError>(error_);
    }

    static std::string describe(ParseState state) {
        switch (state) {
            case ParseState::METHOD: return "method";
            case ParseState::URL: return "URL";
            case ParseState::VERSION: return "version";
            case ParseState::HEADER_NAME: return "header name";
            case ParseState::HEADER_VALUE: return "header value";
            default: return "request";
        }
    }

    // Method tokens are upper-case letters and '_' (BITS_POST)
    bool parse_method(char c) {
        if (c == ' ') {
            if (buffer_.empty()) {
                return false;
            }
            request_.method = HttpMethodUtils::from_string(buffer_);
            if (request_.method == HttpMethod::UNKNOWN) {
                return false;
            }
            buffer_.clear();
            state_ = ParseState::URL;
            return true;
        }

        if (!std::isupper(static_cast<unsigned char>(c)) && c != '_') {
            return false;
        }

        buffer_ += c;
        return true;
    }

    bool parse_url(char c) {
        if (c == ' ') {
            if (buffer_.empty()) {
                return false;
            }
            request_.url = buffer_;
            buffer_.clear();
            state_ = ParseState::VERSION;
            return true;
        }

        if (!std::isprint(static_cast<unsigned char>(c))) {
            return false;
        }

        buffer_ += c;
        return true;
    }

    bool parse_version(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }

        if (c == '\n' && last_char_was_cr_) {
            if (buffer_ == "HTTP/1.1") {
                request_.version = HttpVersion::HTTP_1_1;
            } else if (buffer_ == "HTTP/1.0") {
                request_.version = HttpVersion::HTTP_1_0;
            } else {
                return false;
            }
            buffer_.clear();
            last_char_was_cr_ = false;
            state_ = ParseState::HEADER_NAME;
            return true;
        }

        last_char_was_cr_ = false;
        buffer_ += c;
        return true;
    }

    bool parse_header_name(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }

        if (c == '\n' && last_char_was_cr_) {
            last_char_was_cr_ = false;
            return finish_headers();
        }

        last_char_was_cr_ = false;

        if (c == ':') {
            if (buffer_.empty()) {
                return false;
            }
            current_header_name_ = buffer_;
            buffer_.clear();
            state_ = ParseState::HEADER_VALUE;
            return true;
        }

        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') {
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

        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }

        if (c == '\n' && last_char_was_cr_) {
            while (!buffer_.empty() && (buffer_.back() == ' ' || buffer_.back() == '\t')) {
                buffer_.pop_back();
            }
            request_.headers[current_header_name_] = buffer_;
            buffer_.clear();
            current_header_name_.clear();
            last_char_was_cr_ = false;
            state_ = ParseState::HEADER_NAME;
            return true;
        }

        last_char_was_cr_ = false;
        buffer_ += c;
        return true;
    }

    // Empty line seen: decide whether a body follows
    bool finish_headers() {
        if (request_.has_header("Transfer-Encoding")) {
            fail(HttpStatus::NOT_IMPLEMENTED, "Transfer-Encoding is not supported");
            return false;
        }

        const std::string content_length = request_.get_header("Content-Length");
        if (content_length.empty()) {
            state_ = ParseState::COMPLETE;
            return true;
        }

        unsigned long long length = 0;
        const char* begin = content_length.data();
        const char* end = begin + content_length.size();
        auto [ptr, ec] = std::from_chars(begin, end, length);
        if (ec != std::errc() || ptr != end) {
            fail(HttpStatus::BAD_REQUEST, "Invalid Content-Length: " + content_length);
            return false;
        }
        if (length > max_body_size_) {
            fail(HttpStatus::PAYLOAD_TOO_LARGE,
                 "Request body of " + content_length + " bytes exceeds limit of " +
                 std::to_string(max_body_size_));
            return false;
        }

        expected_body_ = static_cast<size_t>(length);
        if (expected_body_ == 0) {
            state_ = ParseState::COMPLETE;
            return true;
        }
        request_.body.reserve(expected_body_);
        state_ = ParseState::BODY;
        return true;
    }
};

} // namespace network
} // namespace bitsd
