#pragma once

#include "adpush/core/result.hpp"

#include <cstdint>
#include <string>

namespace adpush::network {

/**
 * @brief Absolute http/https URL split into the parts a client connection needs
 *
 * Example: "https://graph-video.facebook.com/v18.0/act_1/advideos?x=1"
 *   scheme = "https", host = "graph-video.facebook.com", port = 443,
 *   target = "/v18.0/act_1/advideos?x=1"
 */
struct Url {
    std::string scheme;
    std::string host;
    std::uint16_t port = 0;
    std::string target = "/";

    bool is_tls() const { return scheme == "https"; }

    /// Value for the Host header; omits the port when it is the scheme default
    std::string host_header() const;

    /// Identity used by the connection pool
    std::string authority_key() const;

    /// Returns a copy whose target is @p path (relative to nothing, must start with '/')
    Url with_target(std::string path) const;
};

Result<Url> parse_url(const std::string& text);

/// Percent-encodes everything outside the RFC 3986 unreserved set
std::string url_encode(const std::string& value);

} // namespace adpush::network
