#pragma once

#include "http_types.hpp"
#include "ingest/core/result.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace ingest {
namespace network {

/**
 * @brief States of the incremental HTTP/1.1 response parser
 *
 * Response format:
 * HTTP-VERSION SP STATUS-CODE SP REASON CRLF
 * Header-Name: Header-Value CRLF   (repeated)
 * CRLF
 * [Body]   framed by Content-Length, chunked encoding, or connection close
 */
enum class ParseState {
    VERSION,
    STATUS_CODE,
    REASON,
    HEADER_NAME,
    HEADER_VALUE,
    BODY,              // Content-Length framed
    CHUNK_SIZE,        // Hex size line of a chunked body
    CHUNK_DATA,
    CHUNK_DATA_END,    // CRLF after a chunk's payload
    TRAILER,           // Trailer section after the last (zero) chunk
    BODY_UNTIL_CLOSE,  // No framing headers, body ends at EOF
    COMPLETE,
    PARSE_ERROR
};

/**
 * @brief Incremental HTTP response parser
 *
 * Feed bytes as they arrive from the socket; parse() reports true once a
 * full response is available. When the peer closes the connection call
 * finish(), which completes close-delimited bodies and rejects truncated
 * ones.
 *
 * ```cpp
 * HttpResponseParser parser;
 * auto done = parser.parse(buffer.data(), bytes_read);
 * if (done.is_ok() && done.value()) {
 *     HttpResponse response = parser.get_response();
 * }
 * ```
 */
class HttpResponseParser {
public:
    HttpResponseParser() { reset(); }

    Result<bool> parse(const char* data, size_t len) {
        for (size_t i = 0; i < len; ++i) {
            if (state_ == ParseState::COMPLETE) {
                return Ok(true);
            }
            if (state_ == ParseState::PARSE_ERROR) {
                return Err<bool>(Error::parse_failure("Parser in error state"));
            }

            // Bulk copy payload bytes instead of going char by char
            if (state_ == ParseState::BODY || state_ == ParseState::CHUNK_DATA) {
                const size_t take = std::min(len - i, remaining_);
                response_.body.insert(response_.body.end(),
                                      reinterpret_cast<const uint8_t*>(data + i),
                                      reinterpret_cast<const uint8_t*>(data + i + take));
                remaining_ -= take;
                i += take - 1;
                if (remaining_ == 0) {
                    state_ = state_ == ParseState::BODY ? ParseState::COMPLETE
                                                        : ParseState::CHUNK_DATA_END;
                }
                continue;
            }
            if (state_ == ParseState::BODY_UNTIL_CLOSE) {
                response_.body.insert(response_.body.end(),
                                      reinterpret_cast<const uint8_t*>(data + i),
                                      reinterpret_cast<const uint8_t*>(data + len));
                return Ok(false);
            }

            if (!step(data[i])) {
                state_ = ParseState::PARSE_ERROR;
                return Err<bool>(Error::parse_failure(error_));
            }
        }
        return Ok(state_ == ParseState::COMPLETE);
    }

    /// Signal end of stream from the peer.
    Result<void> finish() {
        if (state_ == ParseState::BODY_UNTIL_CLOSE) {
            state_ = ParseState::COMPLETE;
        }
        if (state_ != ParseState::COMPLETE) {
            return Err<void>(Error::network_failure("Connection closed before the response was complete"));
        }
        return Ok();
    }

    const HttpResponse& get_response() const {
        return response_;
    }

    bool is_complete() const {
        return state_ == ParseState::COMPLETE;
    }

    void reset() {
        state_ = ParseState::VERSION;
        response_ = HttpResponse();
        buffer_.clear();
        current_header_name_.clear();
        remaining_ = 0;
        last_char_was_cr_ = false;
        error_.clear();
    }

private:
    ParseState state_;
    HttpResponse response_;
    std::string buffer_;
    std::string current_header_name_;
    size_t remaining_;                 // Bytes left in the current body or chunk
    bool last_char_was_cr_;
    std::string error_;

    bool fail(const std::string& message) {
        error_ = message;
        return false;
    }

    bool step(char c) {
        switch (state_) {
            case ParseState::VERSION: return parse_version(c);
            case ParseState::STATUS_CODE: return parse_status_code(c);
            case ParseState::REASON: return parse_line(c, [this] { return end_reason(); });
            case ParseState::HEADER_NAME: return parse_header_name(c);
            case ParseState::HEADER_VALUE: return parse_line(c, [this] { return end_header_value(); });
            case ParseState::CHUNK_SIZE: return parse_line(c, [this] { return end_chunk_size(); });
            case ParseState::CHUNK_DATA_END: return parse_line(c, [this] { return end_chunk_data(); });
            case ParseState::TRAILER: return parse_line(c, [this] { return end_trailer_line(); });
            default: return fail("Unexpected parser state");
        }
    }

    /// Accumulates a CRLF-terminated line into buffer_ and calls @p on_end.
    template<typename OnEnd>
    bool parse_line(char c, OnEnd on_end) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }
        if (c == '\n' && last_char_was_cr_) {
            last_char_was_cr_ = false;
            const bool ok = on_end();
            buffer_.clear();
            return ok;
        }
        last_char_was_cr_ = false;
        buffer_ += c;
        return true;
    }

    bool parse_version(char c) {
        if (c == ' ') {
            if (buffer_ != "HTTP/1.1" && buffer_ != "HTTP/1.0") {
                return fail("Unsupported HTTP version: " + buffer_);
            }
            buffer_.clear();
            state_ = ParseState::STATUS_CODE;
            return true;
        }
        if (!std::isprint(static_cast<unsigned char>(c)) || buffer_.size() > 8) {
            return fail("Malformed status line");
        }
        buffer_ += c;
        return true;
    }

    bool parse_status_code(char c) {
        if (c == ' ' || c == '\r') {
            if (buffer_.size() != 3) {
                return fail("Malformed status code: " + buffer_);
            }
            response_.status_code = std::stoi(buffer_);
            buffer_.clear();
            state_ = ParseState::REASON;
            last_char_was_cr_ = (c == '\r');
            return true;
        }
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return fail("Malformed status code");
        }
        buffer_ += c;
        return true;
    }

    bool end_reason() {
        response_.reason_phrase = buffer_;
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
                return fail("Header line without colon: " + buffer_);
            }
            return begin_body();
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
        if (!std::isgraph(static_cast<unsigned char>(c))) {
            return fail("Invalid character in header name");
        }
        buffer_ += c;
        return true;
    }

    bool end_header_value() {
        const auto first = buffer_.find_first_not_of(" \t");
        const auto last = buffer_.find_last_not_of(" \t");
        response_.headers[current_header_name_] =
            first == std::string::npos ? std::string() : buffer_.substr(first, last - first + 1);
        current_header_name_.clear();
        state_ = ParseState::HEADER_NAME;
        return true;
    }

    bool begin_body() {
        const int status = response_.status_code;
        if ((status >= 100 && status < 200) || status == 204 || status == 304) {
            state_ = ParseState::COMPLETE;
            return true;
        }

        std::string encoding = response_.get_header("Transfer-Encoding");
        for (auto& ch : encoding) {
            ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
        }
        if (encoding.find("chunked") != std::string::npos) {
            state_ = ParseState::CHUNK_SIZE;
            return true;
        }

        const std::string content_length = response_.get_header("Content-Length");
        if (!content_length.empty()) {
            try {
                remaining_ = std::stoull(content_length);
            } catch (const std::exception&) {
                return fail("Invalid Content-Length: " + content_length);
            }
            if (remaining_ == 0) {
                state_ = ParseState::COMPLETE;
                return true;
            }
            response_.body.reserve(remaining_);
            state_ = ParseState::BODY;
            return true;
        }

        state_ = ParseState::BODY_UNTIL_CLOSE;
        return true;
    }

    bool end_chunk_size() {
        // Chunk extensions after ';' are ignored
        const std::string size_text = buffer_.substr(0, buffer_.find(';'));
        try {
            size_t consumed = 0;
            remaining_ = std::stoull(size_text, &consumed, 16);
            if (consumed == 0) {
                return fail("Empty chunk size");
            }
        } catch (const std::exception&) {
            return fail("Invalid chunk size: " + size_text);
        }
        state_ = remaining_ == 0 ? ParseState::TRAILER : ParseState::CHUNK_DATA;
        return true;
    }

    bool end_chunk_data() {
        if (!buffer_.empty()) {
            return fail("Chunk payload longer than its declared size");
        }
        state_ = ParseState::CHUNK_SIZE;
        return true;
    }

    bool end_trailer_line() {
        if (buffer_.empty()) {
            state_ = ParseState::COMPLETE;
        }
        return true;
    }
};

} // namespace network
} // namespace ingest
