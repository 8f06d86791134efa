#include "adpush/network/http_types.hpp"

#include <algorithm>
#include <cctype>

namespace adpush {
namespace network {

namespace {

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::vector<uint8_t> assemble(const std::string& head, const std::vector<uint8_t>& body) {
    std::vector<uint8_t> result;
    result.reserve(head.size() + body.size());
    result.insert(result.end(), head.begin(), head.end());
    result.insert(result.end(), body.begin(), body.end());
    return result;
}

} // namespace

std::vector<uint8_t> HttpRequest::serialize() const {
    std::ostringstream oss;
    oss << HttpMethodUtils::to_string(method) << " " << url << " "
        << version_to_string(version) << "\r\n";

    for (const auto& [name, value] : headers) {
        if (lowercase(name) == "content-length") {
            continue;
        }
        oss << name << ": " << value << "\r\n";
    }
    oss << "Content-Length: " << body.size() << "\r\n";
    oss << "\r\n";

    return assemble(oss.str(), body);
}

bool HttpResponse::keep_alive() const {
    const std::string connection = lowercase(get_header("Connection"));
    if (version == HttpVersion::HTTP_1_0) {
        return connection == "keep-alive";
    }
    return connection != "close";
}

std::vector<uint8_t> HttpResponse::serialize() const {
    std::ostringstream oss;
    oss << version_to_string(version) << " " << status_code << " " << reason_phrase << "\r\n";

    bool has_length = false;
    for (const auto& [name, value] : headers) {
        if (lowercase(name) == "content-length") {
            has_length = true;
        }
        oss << name << ": " << value << "\r\n";
    }
    if (!has_length) {
        oss << "Content-Length: " << body.size() << "\r\n";
    }
    oss << "\r\n";

    return assemble(oss.str(), body);
}

std::string HttpResponse::get_reason_phrase(HttpStatus status) {
    switch (status) {
        case HttpStatus::OK: return "OK";
        case HttpStatus::BAD_REQUEST: return "Bad Request";
        case HttpStatus::UNAUTHORIZED: return "Unauthorized";
        case HttpStatus::NOT_FOUND: return "Not Found";
        case HttpStatus::METHOD_NOT_ALLOWED: return "Method Not Allowed";
        case HttpStatus::GONE: return "Gone";
        case HttpStatus::TOO_MANY_REQUESTS: return "Too Many Requests";
        case HttpStatus::INTERNAL_SERVER_ERROR: return "Internal Server Error";
        case HttpStatus::BAD_GATEWAY: return "Bad Gateway";
        case HttpStatus::SERVICE_UNAVAILABLE: return "Service Unavailable";
        case HttpStatus::GATEWAY_TIMEOUT: return "Gateway Timeout";
    }
    return "Unknown";
}

} // namespace network
} // namespace adpush
