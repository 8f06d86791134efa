#include "adpush/network/url.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace adpush::network {

std::string Url::host_header() const {
    const bool default_port = (is_tls() && port == 443) || (!is_tls() && port == 80);
    return default_port ? host : host + ":" + std::to_string(port);
}

std::string Url::authority_key() const {
    return scheme + "://" + host + ":" + std::to_string(port);
}

Url Url::with_target(std::string path) const {
    Url copy = *this;
    copy.target = std::move(path);
    if (copy.target.empty() || copy.target.front() != '/') {
        copy.target.insert(copy.target.begin(), '/');
    }
    return copy;
}

Result<Url> parse_url(const std::string& text) {
    const auto scheme_end = text.find("://");
    if (scheme_end == std::string::npos) {
        return Err<Url>(std::string("Missing scheme in URL: ") + text);
    }

    Url url;
    url.scheme = text.substr(0, scheme_end);
    std::transform(url.scheme.begin(), url.scheme.end(), url.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (url.scheme != "http" && url.scheme != "https") {
        return Err<Url>(std::string("Unsupported URL scheme: ") + url.scheme);
    }

    const auto authority_begin = scheme_end + 3;
    const auto path_begin = text.find_first_of("/?", authority_begin);
    const std::string authority = text.substr(authority_begin,
        path_begin == std::string::npos ? std::string::npos : path_begin - authority_begin);
    if (authority.empty()) {
        return Err<Url>(std::string("Missing host in URL: ") + text);
    }

    const auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
        url.host = authority.substr(0, colon);
        const std::string port_text = authority.substr(colon + 1);
        if (port_text.empty() || port_text.size() > 5 ||
            !std::all_of(port_text.begin(), port_text.end(),
                         [](unsigned char c) { return std::isdigit(c) != 0; })) {
            return Err<Url>(std::string("Invalid port in URL: ") + text);
        }
        const unsigned long port = std::stoul(port_text);
        if (port == 0 || port > 65535) {
            return Err<Url>(std::string("Port out of range in URL: ") + text);
        }
        url.port = static_cast<std::uint16_t>(port);
    } else {
        url.host = authority;
        url.port = url.is_tls() ? 443 : 80;
    }

    if (url.host.empty()) {
        return Err<Url>(std::string("Missing host in URL: ") + text);
    }

    if (path_begin != std::string::npos) {
        url.target = text.substr(path_begin);
        if (url.target.front() == '?') {
            url.target.insert(url.target.begin(), '/');
        }
    }
    return Ok(std::move(url));
}

std::string url_encode(const std::string& value) {
    std::ostringstream oss;
    oss << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            oss << static_cast<char>(c);
        } else {
            oss << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return oss.str();
}

} // namespace adpush::network
