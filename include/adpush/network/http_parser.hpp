#pragma once

#include "adpush/core/result.hpp"
#include "adpush/network/http_types.hpp"

#include <cstddef>
#include <string>

namespace adpush {
namespace network {

/**
 * @brief States of the incremental HTTP/1.x message parser
 *
 * Network data arrives in arbitrary slices, so the parser keeps its
 * position between calls:
 *
 * START_LINE    <- "POST /v18.0/act_1/advideos HTTP/1.1" or "HTTP/1.1 200 OK"
 * HEADER_LINE   <- "Name: value" lines until an empty line
 * BODY          <- exactly Content-Length bytes
 * CHUNK_*       <- Transfer-Encoding: chunked framing (responses from proxies)
 * BODY_UNTIL_CLOSE <- response without length; complete on EOF
 */
enum class ParseState {
    START_LINE,
    HEADER_LINE,
    BODY,
    CHUNK_SIZE,
    CHUNK_DATA,
    CHUNK_DATA_END,
    CHUNK_TRAILER,
    BODY_UNTIL_CLOSE,
    COMPLETE,
    PARSE_ERROR
};

/**
 * @brief Shared header/body machinery for request and response parsing
 *
 * Usage:
 * ```cpp
 * HttpResponseParser parser;
 * while (!parser.is_complete()) {
 *     auto n = socket.read_some(buffer);
 *     auto done = parser.parse(buffer.data(), n);
 *     if (done.is_error()) { ... }
 * }
 * HttpResponse response = parser.get_response();
 * ```
 *
 * parse() stops at the end of one message; consumed() tells how many bytes
 * of the last slice belonged to it so a keep-alive reader can detect
 * pipelined leftovers.
 */
class HttpMessageParser {
public:
    static constexpr std::size_t kMaxHeaderBytes = 64 * 1024;

    virtual ~HttpMessageParser() = default;

    /**
     * @brief Feed a slice of bytes
     * @return true once a full message has been parsed, false if more data is needed
     */
    Result<bool> parse(const char* data, std::size_t len);

    /**
     * @brief Signal end of stream
     *
     * Completes a read-until-close body; anywhere else a premature EOF is an error.
     */
    Result<bool> finish_on_eof();

    bool is_complete() const { return state_ == ParseState::COMPLETE; }

    ParseState state() const { return state_; }

    std::size_t consumed() const { return consumed_; }

    void reset();

protected:
    HttpMessageParser() = default;

    virtual bool parse_start_line(const std::string& line) = 0;
    virtual HeaderMap& message_headers() = 0;
    virtual std::vector<uint8_t>& message_body() = 0;
    virtual void clear_message() = 0;

    /// Responses to HEAD, 1xx, 204 and 304 never carry a body
    virtual bool message_has_no_body() const { return false; }

    /// Only responses may delimit the body by closing the connection
    virtual bool allows_body_until_close() const { return false; }

private:
    bool take_line(char c);
    bool on_header_line(const std::string& line);
    bool begin_body();
    bool on_chunk_size_line(const std::string& line);

    ParseState state_ = ParseState::START_LINE;
    std::string line_;
    std::size_t header_bytes_ = 0;
    std::size_t remaining_ = 0;      // Bytes left in the body or current chunk
    std::size_t consumed_ = 0;
};

class HttpRequestParser : public HttpMessageParser {
public:
    HttpRequestParser() { reset(); }

    HttpRequest get_request() const { return request_; }

protected:
    bool parse_start_line(const std::string& line) override;
    HeaderMap& message_headers() override { return request_.headers; }
    std::vector<uint8_t>& message_body() override { return request_.body; }
    void clear_message() override { request_ = HttpRequest(); }

private:
    HttpRequest request_;
};

class HttpResponseParser : public HttpMessageParser {
public:
    HttpResponseParser() { reset(); }

    /// Must be set before parsing the answer to a HEAD request
    void expect_head_response(bool head) { head_response_ = head; }

    HttpResponse get_response() const { return response_; }

protected:
    bool parse_start_line(const std::string& line) override;
    HeaderMap& message_headers() override { return response_.headers; }
    std::vector<uint8_t>& message_body() override { return response_.body; }
    void clear_message() override { response_ = HttpResponse(); }
    bool message_has_no_body() const override;
    bool allows_body_until_close() const override { return true; }

private:
    HttpResponse response_;
    bool head_response_ = false;
};

} // namespace network
} // namespace adpush
