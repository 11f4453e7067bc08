#pragma once

#include "stratus/core/result.hpp"
#include "stratus/network/http_types.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <string>

namespace stratus {
namespace network {

/**
 * @brief State machine states for HTTP message parsing
 *
 * START_LINE = METHOD SP URL SP VERSION CRLF   (request)
 *            | VERSION SP CODE SP REASON CRLF  (response)
 * Header-Name: Header-Value CRLF               (repeated)
 * CRLF
 * [Body of Content-Length bytes]
 */
enum class ParseState {
    START_LINE,
    HEADER_NAME,
    HEADER_VALUE,
    BODY,
    COMPLETE,
    PARSE_ERROR  // renamed to avoid Windows macro conflict
};

/**
 * @brief Incremental HTTP/1.x parser shared by the agent server and the client
 *
 * Data can be fed in arbitrary chunks as it arrives from the socket. The
 * body is copied in bulk, which matters for megabyte-sized file segments.
 */
template<typename Message>
class BasicHttpParser {
public:
    static constexpr std::size_t kDefaultMaxBodySize = 64 * 1024 * 1024;

    explicit BasicHttpParser(std::size_t max_body_size = kDefaultMaxBodySize)
        : max_body_size_(max_body_size) {
        reset();
    }

    /**
     * @brief Feed more bytes
     * @return true once the message is complete, false when more data is needed
     */
    Result<bool> parse(const char* data, std::size_t len) {
        std::size_t i = 0;
        while (i < len) {
            if (state_ == ParseState::COMPLETE) {
                return Ok(true);
            }
            if (state_ == ParseState::PARSE_ERROR) {
                return Err<bool>(std::string("Parser in error state"));
            }

            if (state_ == ParseState::BODY) {
                const std::size_t take = std::min(len - i, expected_body_ - message_.body.size());
                message_.body.insert(message_.body.end(),
                                     reinterpret_cast<const uint8_t*>(data + i),
                                     reinterpret_cast<const uint8_t*>(data + i + take));
                i += take;
                if (message_.body.size() >= expected_body_) {
                    state_ = ParseState::COMPLETE;
                }
                continue;
            }

            const char c = data[i++];
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
                default:
                    break;
            }

            if (!ok) {
                const auto reason = error_;
                state_ = ParseState::PARSE_ERROR;
                return Err<bool>(reason + " at line " + std::to_string(line_));
            }
        }

        return Ok(state_ == ParseState::COMPLETE);
    }

    const Message& message() const { return message_; }

    bool is_complete() const { return state_ == ParseState::COMPLETE; }

    ParseState state() const { return state_; }

    void reset() {
        state_ = ParseState::START_LINE;
        message_ = Message();
        buffer_.clear();
        current_header_name_.clear();
        expected_body_ = 0;
        line_ = 1;
        last_char_was_cr_ = false;
        error_.clear();
    }

private:
    Message message_;
    ParseState state_ = ParseState::START_LINE;
    std::string buffer_;
    std::string current_header_name_;
    std::size_t expected_body_ = 0;
    std::size_t max_body_size_;
    std::size_t line_ = 1;
    bool last_char_was_cr_ = false;
    std::string error_;

    bool fail(const std::string& reason) {
        error_ = reason;
        return false;
    }

    bool parse_start_line(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }
        if (c == '\n' && last_char_was_cr_) {
            last_char_was_cr_ = false;
            const bool ok = apply_start_line(buffer_);
            buffer_.clear();
            state_ = ParseState::HEADER_NAME;
            return ok;
        }
        last_char_was_cr_ = false;
        if (!std::isprint(static_cast<unsigned char>(c))) {
            return fail("Invalid character in start line");
        }
        buffer_ += c;
        return true;
    }

    bool apply_start_line(const std::string& line);

    bool parse_header_name(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }

        if (c == '\n' && last_char_was_cr_) {
            // Empty line ends the header block
            last_char_was_cr_ = false;
            const std::string content_length = message_.get_header("Content-Length");
            if (!content_length.empty()) {
                try {
                    expected_body_ = std::stoull(content_length);
                } catch (const std::exception&) {
                    return fail("Invalid Content-Length");
                }
                if (expected_body_ > max_body_size_) {
                    return fail("Body exceeds " + std::to_string(max_body_size_) + " bytes");
                }
                if (expected_body_ > 0) {
                    message_.body.reserve(expected_body_);
                    state_ = ParseState::BODY;
                    return true;
                }
            }
            state_ = ParseState::COMPLETE;
            return true;
        }

        last_char_was_cr_ = false;

        if (c == ':') {
            if (buffer_.empty()) {
                return fail("Empty header name");
            }
            current_header_name_ = buffer_;
            buffer_.clear();
            state_ = ParseState::HEADER_VALUE;
            return true;
        }

        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-') {
            return fail("Invalid character in header name");
        }

        buffer_ += c;
        return true;
    }

    bool parse_header_value(char c) {
        // Skip leading whitespace after the colon
        if (buffer_.empty() && c == ' ') {
            return true;
        }

        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }

        if (c == '\n' && last_char_was_cr_) {
            message_.headers[current_header_name_] = buffer_;
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

    static bool parse_version(const std::string& token, HttpVersion& version) {
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
};

template<>
inline bool BasicHttpParser<HttpRequest>::apply_start_line(const std::string& line) {
    const auto first = line.find(' ');
    const auto second = first == std::string::npos ? std::string::npos : line.find(' ', first + 1);
    if (first == std::string::npos || second == std::string::npos) {
        return fail("Malformed request line");
    }

    message_.method = HttpMethodUtils::from_string(line.substr(0, first));
    if (message_.method == HttpMethod::UNKNOWN) {
        return fail("Unknown HTTP method");
    }

    message_.url = line.substr(first + 1, second - first - 1);
    if (message_.url.empty()) {
        return fail("Empty URL");
    }

    if (!parse_version(line.substr(second + 1), message_.version)) {
        return fail("Unknown HTTP version");
    }
    return true;
}

template<>
inline bool BasicHttpParser<HttpResponse>::apply_start_line(const std::string& line) {
    const auto first = line.find(' ');
    if (first == std::string::npos) {
        return fail("Malformed status line");
    }
    if (!parse_version(line.substr(0, first), message_.version)) {
        return fail("Unknown HTTP version");
    }

    const auto second = line.find(' ', first + 1);
    const std::string code = line.substr(first + 1, second == std::string::npos ? std::string::npos
                                                                                : second - first - 1);
    if (code.size() != 3 || !std::all_of(code.begin(), code.end(),
                                         [](char ch) { return std::isdigit(static_cast<unsigned char>(ch)); })) {
        return fail("Invalid status code");
    }
    message_.status_code = std::stoi(code);
    message_.reason_phrase = second == std::string::npos ? std::string() : line.substr(second + 1);
    return true;
}

using HttpParser = BasicHttpParser<HttpRequest>;
using HttpResponseParser = BasicHttpParser<HttpResponse>;

} // namespace network
} // namespace stratus
