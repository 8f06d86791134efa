#pragma once

#include <cstdint>
#include <cstring>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

#ifndef _WIN32
#include <strings.h>
#endif

namespace adpush {
namespace network {

/**
 * @brief HTTP request methods used by the upload protocol and its test endpoint
 */
enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE_METHOD,  // DELETE collides with a Windows macro
    HEAD,
    UNKNOWN
};

enum class HttpVersion {
    HTTP_1_0,  // Connection closes after each exchange unless keep-alive is negotiated
    HTTP_1_1,  // Persistent connections by default
    UNKNOWN
};

/**
 * @brief Status codes the client classifies or the loopback endpoint emits
 */
enum class HttpStatus {
    OK = 200,
    BAD_REQUEST = 400,
    UNAUTHORIZED = 401,
    NOT_FOUND = 404,
    METHOD_NOT_ALLOWED = 405,
    GONE = 410,
    TOO_MANY_REQUESTS = 429,
    INTERNAL_SERVER_ERROR = 500,
    BAD_GATEWAY = 502,
    SERVICE_UNAVAILABLE = 503,
    GATEWAY_TIMEOUT = 504
};

using HeaderMap = std::unordered_map<std::string, std::string>;

/**
 * @brief Case-insensitive header lookup
 *
 * Headers are stored as received; RFC 7230 makes field names
 * case-insensitive, so every lookup goes through this helper.
 *
 * @return Header value if present, empty string otherwise
 */
inline std::string find_header(const HeaderMap& headers, const std::string& name) {
    for (const auto& [key, value] : headers) {
#ifdef _WIN32
        if (_stricmp(key.c_str(), name.c_str()) == 0) {
#else
        if (strcasecmp(key.c_str(), name.c_str()) == 0) {
#endif
            return value;
        }
    }
    return "";
}

/**
 * @brief Represents an HTTP request
 *
 * Request-Line = Method SP Request-Target SP HTTP-Version CRLF
 * *(header-field CRLF)
 * CRLF
 * [ message-body ]
 *
 * The body is a byte vector because transfer-phase requests carry raw
 * file bytes inside a multipart envelope.
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::UNKNOWN;
    std::string url;                                       // Request target, e.g. "/v18.0/act_1/advideos"
    HttpVersion version = HttpVersion::HTTP_1_1;
    HeaderMap headers;
    std::vector<uint8_t> body;

    std::string get_header(const std::string& name) const { return find_header(headers, name); }

    bool has_header(const std::string& name) const { return !get_header(name).empty(); }

    void set_header(const std::string& name, const std::string& value) { headers[name] = value; }

    /// Path part of the target, without the query string
    std::string path() const {
        const auto query = url.find('?');
        return query == std::string::npos ? url : url.substr(0, query);
    }

    /// Raw query string (after '?'), empty when absent
    std::string query() const {
        const auto query = url.find('?');
        return query == std::string::npos ? std::string() : url.substr(query + 1);
    }

    std::string body_as_string() const { return std::string(body.begin(), body.end()); }

    /**
     * @brief Serialize to wire format for transmission by a client
     *
     * Content-Length is always written (also for empty bodies) so the
     * server never has to guess where the message ends.
     */
    std::vector<uint8_t> serialize() const;
};

/**
 * @brief Represents an HTTP response
 *
 * Status-Line = HTTP-Version SP Status-Code SP Reason-Phrase CRLF
 * *(header-field CRLF)
 * CRLF
 * [ message-body ]
 */
struct HttpResponse {
    HttpVersion version = HttpVersion::HTTP_1_1;
    int status_code = 200;
    std::string reason_phrase;
    HeaderMap headers;
    std::vector<uint8_t> body;

    HttpResponse() = default;

    explicit HttpResponse(HttpStatus status)
        : status_code(static_cast<int>(status))
        , reason_phrase(get_reason_phrase(status)) {
    }

    std::string get_header(const std::string& name) const { return find_header(headers, name); }

    bool has_header(const std::string& name) const { return !get_header(name).empty(); }

    void set_header(const std::string& name, const std::string& value) { headers[name] = value; }

    /// Sets the body and the matching Content-Length header
    void set_body(const std::string& content) {
        body.assign(content.begin(), content.end());
        headers["Content-Length"] = std::to_string(body.size());
    }

    std::string body_as_string() const { return std::string(body.begin(), body.end()); }

    bool is_success() const { return status_code >= 200 && status_code < 300; }

    /**
     * @brief Whether the connection may be reused after this response
     *
     * HTTP/1.1 defaults to persistent connections; HTTP/1.0 requires an
     * explicit "Connection: keep-alive".
     */
    bool keep_alive() const;

    std::vector<uint8_t> serialize() const;

    static std::string get_reason_phrase(HttpStatus status);
};

class HttpMethodUtils {
public:
    static HttpMethod from_string(const std::string& method_str) {
        if (method_str == "GET") return HttpMethod::GET;
        if (method_str == "POST") return HttpMethod::POST;
        if (method_str == "PUT") return HttpMethod::PUT;
        if (method_str == "DELETE") return HttpMethod::DELETE_METHOD;
        if (method_str == "HEAD") return HttpMethod::HEAD;
        return HttpMethod::UNKNOWN;
    }

    static std::string to_string(HttpMethod method) {
        switch (method) {
            case HttpMethod::GET: return "GET";
            case HttpMethod::POST: return "POST";
            case HttpMethod::PUT: return "PUT";
            case HttpMethod::DELETE_METHOD: return "DELETE";
            case HttpMethod::HEAD: return "HEAD";
            default: return "UNKNOWN";
        }
    }
};

inline std::string version_to_string(HttpVersion version) {
    return version == HttpVersion::HTTP_1_0 ? "HTTP/1.0" : "HTTP/1.1";
}

} // namespace network
} // namespace adpush
