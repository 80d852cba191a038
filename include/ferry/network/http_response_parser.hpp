#pragma once

#include "ferry/core/result.hpp"
#include "ferry/network/http_types.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <stdexcept>
#include <string>

namespace ferry {
namespace network {

/**
 * @brief States of the incremental HTTP response parser
 *
 * HTTP-Version SP Status-Code SP Reason-Phrase CRLF
 * *(Header-Name ":" Header-Value CRLF)
 * CRLF
 * [Body]
 */
enum class ParseState {
    VERSION,
    STATUS_CODE,
    REASON,
    HEADER_NAME,
    HEADER_VALUE,
    BODY,
    COMPLETE,
    PARSE_ERROR
};

/**
 * @brief HTTP/1.x response parser fed with socket reads
 *
 * Bodies are delimited by Content-Length when present. Without it the body
 * runs until the peer closes the connection, which the caller signals with
 * finish(). Chunked bodies are buffered and decoded in finish().
 *
 * Usage:
 * ```cpp
 * HttpResponseParser parser;
 * while (!parser.is_complete()) {
 *     auto data = socket.receive(4096);
 *     if (data.value().empty()) { parser.finish(); break; }
 *     parser.parse(reinterpret_cast<const char*>(data.value().data()), data.value().size());
 * }
 * ```
 */
class HttpResponseParser {
public:
    HttpResponseParser() { reset(); }

    /// @return true once the response is complete, false if more data is needed
    Result<bool> parse(const char* data, size_t len) {
        for (size_t i = 0; i < len; ++i) {
            const char c = data[i];
            if (c == '\n') {
                line_++;
            }

            bool ok = true;
            switch (state_) {
                case ParseState::VERSION:      ok = parse_version(c); break;
                case ParseState::STATUS_CODE:  ok = parse_status_code(c); break;
                case ParseState::REASON:       ok = parse_reason(c); break;
                case ParseState::HEADER_NAME:  ok = parse_header_name(c); break;
                case ParseState::HEADER_VALUE: ok = parse_header_value(c); break;
                case ParseState::BODY:         parse_body(c); break;
                case ParseState::COMPLETE:     return Ok(true);
                case ParseState::PARSE_ERROR:
                    return Err<bool, std::string>("Parser in error state");
            }

            if (!ok) {
                state_ = ParseState::PARSE_ERROR;
                return Err<bool, std::string>("Malformed HTTP response at line " +
                                              std::to_string(line_));
            }

            if (state_ == ParseState::COMPLETE) {
                return Ok(true);
            }
        }
        return Ok(false);
    }

    /**
     * @brief Signal end of stream (peer closed the connection)
     *
     * Completes a close-delimited or chunked body. A response cut off before
     * its headers or before Content-Length bytes arrived is an error.
     */
    Result<void> finish() {
        if (state_ == ParseState::COMPLETE) {
            return Ok();
        }
        if (state_ != ParseState::BODY || has_content_length_) {
            state_ = ParseState::PARSE_ERROR;
            return Err<void>(std::string("Connection closed before response was complete"));
        }
        if (chunked_) {
            auto decoded = decode_chunked(response_.body);
            if (decoded.is_error()) {
                state_ = ParseState::PARSE_ERROR;
                return Err<void>(decoded.error());
            }
            response_.body = std::move(decoded.value());
        }
        state_ = ParseState::COMPLETE;
        return Ok();
    }

    const HttpResponse& response() const { return response_; }

    bool is_complete() const { return state_ == ParseState::COMPLETE; }

    void reset() {
        state_ = ParseState::VERSION;
        response_ = HttpResponse();
        buffer_.clear();
        current_header_name_.clear();
        content_length_ = 0;
        has_content_length_ = false;
        chunked_ = false;
        line_ = 1;
        last_char_was_cr_ = false;
    }

private:
    static constexpr size_t kMaxBodyReserve = 1024 * 1024;

    ParseState state_;
    HttpResponse response_;
    std::string buffer_;
    std::string current_header_name_;
    size_t content_length_;
    bool has_content_length_;
    bool chunked_;
    size_t line_;
    bool last_char_was_cr_;

    bool parse_version(char c) {
        if (c == ' ') {
            if (buffer_ == "HTTP/1.1") {
                response_.version = HttpVersion::HTTP_1_1;
            } else if (buffer_ == "HTTP/1.0") {
                response_.version = HttpVersion::HTTP_1_0;
            } else {
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
            response_.status_code = std::stoi(buffer_);
            buffer_.clear();
            last_char_was_cr_ = (c == '\r');
            state_ = ParseState::REASON;
            return true;
        }
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        buffer_ += c;
        return true;
    }

    bool parse_reason(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }
        if (c == '\n' && last_char_was_cr_) {
            response_.reason_phrase = buffer_;
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
            return begin_body();
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
        if (buffer_.empty() && c == ' ') {
            return true;
        }

        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }

        if (c == '\n' && last_char_was_cr_) {
            response_.headers[current_header_name_] = buffer_;
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

    // Headers done: decide how the body is delimited
    bool begin_body() {
        const std::string transfer_encoding = response_.get_header("Transfer-Encoding");
        if (strcasecmp_cross_platform(transfer_encoding.c_str(), "chunked") == 0) {
            chunked_ = true;
            state_ = ParseState::BODY;
            return true;
        }

        const std::string content_length = response_.get_header("Content-Length");
        if (!content_length.empty()) {
            for (char digit : content_length) {
                if (!std::isdigit(static_cast<unsigned char>(digit))) {
                    return false;
                }
            }
            unsigned long long length = 0;
            try {
                length = std::stoull(content_length);
            } catch (const std::out_of_range&) {
                return false;
            }
            if (length > std::numeric_limits<size_t>::max()) {
                return false;
            }
            has_content_length_ = true;
            content_length_ = static_cast<size_t>(length);
            if (content_length_ == 0) {
                state_ = ParseState::COMPLETE;
                return true;
            }
            // The header is untrusted; the body grows past this as bytes arrive
            response_.body.reserve(std::min(content_length_, kMaxBodyReserve));
            state_ = ParseState::BODY;
            return true;
        }

        // 204 and 304 never carry a body
        if (response_.status_code == 204 || response_.status_code == 304) {
            state_ = ParseState::COMPLETE;
            return true;
        }

        state_ = ParseState::BODY;
        return true;
    }

    void parse_body(char c) {
        response_.body.push_back(static_cast<uint8_t>(c));
        if (has_content_length_ && response_.body.size() >= content_length_) {
            state_ = ParseState::COMPLETE;
        }
    }

    static Result<std::vector<uint8_t>> decode_chunked(const std::vector<uint8_t>& raw) {
        std::vector<uint8_t> decoded;
        size_t pos = 0;
        while (pos < raw.size()) {
            size_t line_end = pos;
            while (line_end + 1 < raw.size() && !(raw[line_end] == '\r' && raw[line_end + 1] == '\n')) {
                ++line_end;
            }
            if (line_end + 1 >= raw.size()) {
                return Err<std::vector<uint8_t>>(std::string("Truncated chunk header"));
            }

            std::string size_line(raw.begin() + static_cast<std::ptrdiff_t>(pos),
                                  raw.begin() + static_cast<std::ptrdiff_t>(line_end));
            const auto extension = size_line.find(';');
            if (extension != std::string::npos) {
                size_line.resize(extension);
            }

            size_t chunk_size = 0;
            try {
                chunk_size = static_cast<size_t>(std::stoull(size_line, nullptr, 16));
            } catch (const std::exception&) {
                return Err<std::vector<uint8_t>>(std::string("Invalid chunk size: ") + size_line);
            }

            pos = line_end + 2;
            if (chunk_size == 0) {
                return Ok(std::move(decoded));
            }
            if (chunk_size > raw.size() - pos) {
                return Err<std::vector<uint8_t>>(std::string("Truncated chunk body"));
            }
            decoded.insert(decoded.end(),
                           raw.begin() + static_cast<std::ptrdiff_t>(pos),
                           raw.begin() + static_cast<std::ptrdiff_t>(pos + chunk_size));
            pos += chunk_size + 2;
        }
        return Err<std::vector<uint8_t>>(std::string("Missing terminating chunk"));
    }
};

} // namespace network
} // namespace ferry
