#pragma once

#include "relay/core/result.hpp"
#include "relay/network/http_types.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace relay {
namespace network {

/**
 * @brief State machine states for HTTP message parsing
 *
 * Request:  METHOD SP URL SP VERSION CRLF
 * Response: VERSION SP STATUS SP REASON CRLF
 * Both:     *(Header-Name: Header-Value CRLF) CRLF [Body]
 */
enum class ParseState {
    METHOD,
    URL,
    VERSION,
    STATUS_VERSION,
    STATUS_CODE,
    REASON,
    HEADER_NAME,
    HEADER_VALUE,
    BODY,
    BODY_UNTIL_CLOSE,  // Response without Content-Length, delimited by EOF
    COMPLETE,
    PARSE_ERROR
};

enum class MessageKind {
    Request,
    Response
};

/**
 * @brief Incremental HTTP/1.1 parser for requests and responses
 *
 * Feed data as it arrives from the socket. The start line and headers are
 * consumed one character at a time; the body is copied in bulk once its
 * length is known.
 *
 * Usage:
 * ```cpp
 * HttpParser parser(MessageKind::Response);
 * auto done = parser.parse(buffer.data(), n);
 * if (done.is_ok() && done.value()) {
 *     HttpResponse response = parser.get_response();
 * }
 * ```
 *
 * Chunked transfer encoding is not supported.
 */
class HttpParser {
public:
    explicit HttpParser(MessageKind kind = MessageKind::Request) : kind_(kind) { reset(); }

    /**
     * @brief Parse incoming data
     *
     * @return true once a complete message has been read, false if more
     *         data is needed, an error if the input is malformed
     */
    relay::Result<bool> parse(const char* data, size_t len) {
        size_t i = 0;
        while (i < len) {
            if (state_ == ParseState::COMPLETE) {
                return relay::Ok(true);
            }
            if (state_ == ParseState::PARSE_ERROR) {
                return relay::Err(std::string("Parser in error state"));
            }

            if (state_ == ParseState::BODY || state_ == ParseState::BODY_UNTIL_CLOSE) {
                i += append_body(data + i, len - i);
                continue;
            }

            char c = data[i++];
            if (c == '\n') {
                line_++;
            }

            bool ok = true;
            switch (state_) {
                case ParseState::METHOD: ok = parse_method(c); break;
                case ParseState::URL: ok = parse_url(c); break;
                case ParseState::VERSION: ok = parse_version(c); break;
                case ParseState::STATUS_VERSION: ok = parse_status_version(c); break;
                case ParseState::STATUS_CODE: ok = parse_status_code(c); break;
                case ParseState::REASON: ok = parse_reason(c); break;
                case ParseState::HEADER_NAME: ok = parse_header_name(c); break;
                case ParseState::HEADER_VALUE: ok = parse_header_value(c); break;
                default: break;
            }

            if (!ok) {
                const std::string where = describe_state(state_);
                state_ = ParseState::PARSE_ERROR;
                return relay::Err("Failed to parse " + where + " at line " + std::to_string(line_));
            }
        }

        return relay::Ok(state_ == ParseState::COMPLETE);
    }

    /**
     * @brief Signal end of input (peer closed the connection)
     *
     * Completes an EOF-delimited response body; any other unfinished
     * message is an error.
     */
    relay::Result<void> finish() {
        if (state_ == ParseState::BODY_UNTIL_CLOSE) {
            state_ = ParseState::COMPLETE;
        }
        if (state_ != ParseState::COMPLETE) {
            return relay::Err("Connection closed while parsing " + describe_state(state_));
        }
        return relay::Ok();
    }

    HttpRequest get_request() const { return request_; }
    HttpResponse get_response() const { return response_; }

    bool is_complete() const { return state_ == ParseState::COMPLETE; }
    ParseState state() const { return state_; }

    void reset() {
        state_ = kind_ == MessageKind::Request ? ParseState::METHOD : ParseState::STATUS_VERSION;
        request_ = HttpRequest();
        response_ = HttpResponse();
        buffer_.clear();
        current_header_name_.clear();
        body_expected_ = 0;
        line_ = 1;
        last_char_was_cr_ = false;
    }

private:
    MessageKind kind_;
    ParseState state_;
    HttpRequest request_;
    HttpResponse response_;
    std::string buffer_;
    std::string current_header_name_;
    size_t body_expected_;
    size_t line_;
    bool last_char_was_cr_;

    HttpHeaders& headers() { return kind_ == MessageKind::Request ? request_.headers : response_.headers; }
    std::vector<uint8_t>& body() { return kind_ == MessageKind::Request ? request_.body : response_.body; }

    static std::string describe_state(ParseState state) {
        switch (state) {
            case ParseState::METHOD: return "HTTP method";
            case ParseState::URL: return "URL";
            case ParseState::VERSION:
            case ParseState::STATUS_VERSION: return "HTTP version";
            case ParseState::STATUS_CODE: return "status code";
            case ParseState::REASON: return "reason phrase";
            case ParseState::HEADER_NAME: return "header name";
            case ParseState::HEADER_VALUE: return "header value";
            case ParseState::BODY:
            case ParseState::BODY_UNTIL_CLOSE: return "body";
            default: return "message";
        }
    }

    static bool parse_version_token(const std::string& token, HttpVersion& version) {
        if (token == "HTTP/1.1") {
            version = HttpVersion::HTTP_1_1;
        } else if (token == "HTTP/1.0") {
            version = HttpVersion::HTTP_1_0;
        } else {
            return false;
        }
        return true;
    }

    // Returns true on CRLF, having consumed the LF.
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
        return false;
    }

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
        if (!std::isupper(static_cast<unsigned char>(c))) {
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
        if (at_line_end(c)) {
            if (!parse_version_token(buffer_, request_.version)) {
                return false;
            }
            buffer_.clear();
            state_ = ParseState::HEADER_NAME;
            return true;
        }
        if (c != '\r') {
            buffer_ += c;
        }
        return true;
    }

    bool parse_status_version(char c) {
        if (c == ' ') {
            if (!parse_version_token(buffer_, response_.version)) {
                return false;
            }
            buffer_.clear();
            state_ = ParseState::STATUS_CODE;
            return true;
        }
        if (!std::isprint(static_cast<unsigned char>(c)) || buffer_.size() > 8) {
            return false;
        }
        buffer_ += c;
        return true;
    }

    bool parse_status_code(char c) {
        if (c == ' ' || c == '\r') {
            if (buffer_.size() != 3) {
                return false;
            }
            response_.status_code = std::atoi(buffer_.c_str());
            buffer_.clear();
            state_ = ParseState::REASON;
            if (c == '\r') {
                last_char_was_cr_ = true;
            }
            return true;
        }
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        buffer_ += c;
        return true;
    }

    bool parse_reason(char c) {
        if (at_line_end(c)) {
            response_.reason_phrase = buffer_;
            buffer_.clear();
            state_ = ParseState::HEADER_NAME;
            return true;
        }
        if (c != '\r') {
            buffer_ += c;
        }
        return true;
    }

    bool parse_header_name(char c) {
        if (at_line_end(c)) {
            if (!buffer_.empty()) {
                return false;
            }
            return headers_complete();
        }
        if (c == '\r') {
            return true;
        }
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
        if (buffer_.empty() && (c == ' ' || c == '\t')) {
            return true;
        }
        if (at_line_end(c)) {
            while (!buffer_.empty() && (buffer_.back() == ' ' || buffer_.back() == '\t')) {
                buffer_.pop_back();
            }
            headers()[current_header_name_] = buffer_;
            buffer_.clear();
            current_header_name_.clear();
            state_ = ParseState::HEADER_NAME;
            return true;
        }
        if (c != '\r') {
            buffer_ += c;
        }
        return true;
    }

    bool headers_complete() {
        if (find_header(headers(), "Transfer-Encoding").size() > 0) {
            return false;
        }

        const std::string content_length = find_header(headers(), "Content-Length");
        if (!content_length.empty()) {
            if (!std::all_of(content_length.begin(), content_length.end(),
                             [](char ch) { return std::isdigit(static_cast<unsigned char>(ch)) != 0; })) {
                return false;
            }
            body_expected_ = static_cast<size_t>(std::strtoull(content_length.c_str(), nullptr, 10));
            if (body_expected_ > 0) {
                body().reserve(body_expected_);
                state_ = ParseState::BODY;
                return true;
            }
            state_ = ParseState::COMPLETE;
            return true;
        }

        // Without Content-Length a request has no body; a response runs to EOF
        // unless its status forbids a body.
        if (kind_ == MessageKind::Response && response_.status_code >= 200 &&
            response_.status_code != 204 && response_.status_code != 304) {
            state_ = ParseState::BODY_UNTIL_CLOSE;
            return true;
        }
        state_ = ParseState::COMPLETE;
        return true;
    }

    size_t append_body(const char* data, size_t len) {
        auto& target = body();
        size_t take = len;
        if (state_ == ParseState::BODY) {
            take = std::min(len, body_expected_ - target.size());
        }
        target.insert(target.end(), reinterpret_cast<const uint8_t*>(data),
                      reinterpret_cast<const uint8_t*>(data) + take);
        if (state_ == ParseState::BODY && target.size() >= body_expected_) {
            state_ = ParseState::COMPLETE;
        }
        return take;
    }
};

} // namespace network
} // namespace relay
