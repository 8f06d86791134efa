#include "adpush/network/http_parser.hpp"

#include <algorithm>
#include <cctype>

namespace adpush {
namespace network {

namespace {

std::string trim(const std::string& text) {
    const auto begin = text.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = text.find_last_not_of(" \t");
    return text.substr(begin, end - begin + 1);
}

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool parse_version(const std::string& token, HttpVersion& version) {
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

} // namespace

void HttpMessageParser::reset() {
    state_ = ParseState::START_LINE;
    line_.clear();
    header_bytes_ = 0;
    remaining_ = 0;
    consumed_ = 0;
    clear_message();
}

Result<bool> HttpMessageParser::parse(const char* data, std::size_t len) {
    consumed_ = 0;
    if (state_ == ParseState::COMPLETE) {
        return Ok(true);
    }
    if (state_ == ParseState::PARSE_ERROR) {
        return Err<bool>(std::string("Parser in error state"));
    }

    std::size_t i = 0;
    while (i < len && state_ != ParseState::COMPLETE) {
        switch (state_) {
            case ParseState::BODY:
            case ParseState::CHUNK_DATA: {
                // Bulk copy; chunk payloads are megabytes and must not go byte by byte
                const std::size_t take = std::min(remaining_, len - i);
                auto& body = message_body();
                body.insert(body.end(), data + i, data + i + take);
                i += take;
                remaining_ -= take;
                if (remaining_ == 0) {
                    state_ = state_ == ParseState::BODY ? ParseState::COMPLETE
                                                        : ParseState::CHUNK_DATA_END;
                }
                break;
            }

            case ParseState::BODY_UNTIL_CLOSE: {
                auto& body = message_body();
                body.insert(body.end(), data + i, data + len);
                i = len;
                break;
            }

            default: {
                const ParseState before = state_;
                if (!take_line(data[i++])) {
                    consumed_ = i;
                    const bool in_head = before == ParseState::START_LINE ||
                                         before == ParseState::HEADER_LINE;
                    state_ = ParseState::PARSE_ERROR;
                    return Err<bool>(std::string(in_head ? "Malformed HTTP message head"
                                                         : "Malformed chunked body framing"));
                }
                break;
            }
        }
    }

    consumed_ = i;
    return Ok(state_ == ParseState::COMPLETE);
}

Result<bool> HttpMessageParser::finish_on_eof() {
    if (state_ == ParseState::BODY_UNTIL_CLOSE || state_ == ParseState::COMPLETE) {
        state_ = ParseState::COMPLETE;
        return Ok(true);
    }
    state_ = ParseState::PARSE_ERROR;
    return Err<bool>(std::string("Connection closed before the message was complete"));
}

bool HttpMessageParser::take_line(char c) {
    if (state_ == ParseState::START_LINE || state_ == ParseState::HEADER_LINE) {
        if (++header_bytes_ > kMaxHeaderBytes) {
            return false;
        }
    }

    if (c != '\n') {
        line_ += c;
        return true;
    }

    // Tolerate bare LF line endings; strip the CR of CRLF
    std::string line;
    line.swap(line_);
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    switch (state_) {
        case ParseState::START_LINE:
            if (line.empty()) {
                return true;  // Stray CRLF between keep-alive messages
            }
            if (!parse_start_line(line)) {
                return false;
            }
            state_ = ParseState::HEADER_LINE;
            return true;

        case ParseState::HEADER_LINE:
            return line.empty() ? begin_body() : on_header_line(line);

        case ParseState::CHUNK_SIZE:
            return on_chunk_size_line(line);

        case ParseState::CHUNK_DATA_END:
            if (!line.empty()) {
                return false;
            }
            state_ = ParseState::CHUNK_SIZE;
            return true;

        case ParseState::CHUNK_TRAILER:
            if (line.empty()) {
                state_ = ParseState::COMPLETE;
            }
            return true;

        default:
            return false;
    }
}

bool HttpMessageParser::on_header_line(const std::string& line) {
    const auto colon = line.find(':');
    if (colon == std::string::npos || colon == 0) {
        return false;
    }
    const std::string name = line.substr(0, colon);
    const bool valid_name = std::all_of(name.begin(), name.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '-' || c == '_';
    });
    if (!valid_name) {
        return false;
    }
    message_headers()[name] = trim(line.substr(colon + 1));
    return true;
}

bool HttpMessageParser::begin_body() {
    if (message_has_no_body()) {
        state_ = ParseState::COMPLETE;
        return true;
    }

    const auto& headers = message_headers();
    if (lowercase(find_header(headers, "Transfer-Encoding")).find("chunked") != std::string::npos) {
        state_ = ParseState::CHUNK_SIZE;
        return true;
    }

    const std::string content_length = find_header(headers, "Content-Length");
    if (!content_length.empty()) {
        if (!std::all_of(content_length.begin(), content_length.end(),
                         [](unsigned char c) { return std::isdigit(c) != 0; }) ||
            content_length.size() > 18) {
            return false;
        }
        remaining_ = static_cast<std::size_t>(std::stoull(content_length));
        if (remaining_ == 0) {
            state_ = ParseState::COMPLETE;
        } else {
            message_body().reserve(remaining_);
            state_ = ParseState::BODY;
        }
        return true;
    }

    state_ = allows_body_until_close() ? ParseState::BODY_UNTIL_CLOSE : ParseState::COMPLETE;
    return true;
}

bool HttpMessageParser::on_chunk_size_line(const std::string& line) {
    const std::string size_text = trim(line.substr(0, line.find(';')));
    if (size_text.empty() || size_text.size() > 15 ||
        !std::all_of(size_text.begin(), size_text.end(),
                     [](unsigned char c) { return std::isxdigit(c) != 0; })) {
        return false;
    }
    remaining_ = static_cast<std::size_t>(std::stoull(size_text, nullptr, 16));
    state_ = remaining_ == 0 ? ParseState::CHUNK_TRAILER : ParseState::CHUNK_DATA;
    return true;
}

bool HttpRequestParser::parse_start_line(const std::string& line) {
    const auto first = line.find(' ');
    const auto last = line.rfind(' ');
    if (first == std::string::npos || first == last) {
        return false;
    }

    request_.method = HttpMethodUtils::from_string(line.substr(0, first));
    if (request_.method == HttpMethod::UNKNOWN) {
        return false;
    }

    request_.url = line.substr(first + 1, last - first - 1);
    if (request_.url.empty() || request_.url.find(' ') != std::string::npos) {
        return false;
    }

    return parse_version(line.substr(last + 1), request_.version);
}

bool HttpResponseParser::parse_start_line(const std::string& line) {
    const auto first = line.find(' ');
    if (first == std::string::npos) {
        return false;
    }
    if (!parse_version(line.substr(0, first), response_.version)) {
        return false;
    }

    const auto second = line.find(' ', first + 1);
    const std::string code = line.substr(first + 1,
        second == std::string::npos ? std::string::npos : second - first - 1);
    if (code.size() != 3 || !std::all_of(code.begin(), code.end(),
                                         [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return false;
    }
    response_.status_code = std::stoi(code);
    response_.reason_phrase = second == std::string::npos ? "" : line.substr(second + 1);
    return true;
}

bool HttpResponseParser::message_has_no_body() const {
    const int status = response_.status_code;
    return head_response_ || (status >= 100 && status < 200) || status == 204 || status == 304;
}

} // namespace network
} // namespace adpush
