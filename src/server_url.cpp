#include "hc/server_url.hpp"
#include <charconv>

namespace hc {

std::string ServerUrl::origin() const {
    if (host.find(':') != std::string::npos) {
        return scheme + "://[" + host + "]:" + std::to_string(port);
    }
    return scheme + "://" + host + ":" + std::to_string(port);
}

std::string ServerUrl::target(const std::string& path) const {
    std::string result = base_path + path;
    if (result.empty()) {
        return "/";
    }
    if (result.front() != '/') {
        result.insert(result.begin(), '/');
    }
    return result;
}

std::expected<ServerUrl, std::string> parse_server_url(const std::string& url) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        return std::unexpected("Missing scheme in server URL: " + url);
    }

    ServerUrl result;
    result.scheme = url.substr(0, scheme_end);
    if (result.scheme == "http") {
        result.port = 80;
    } else if (result.scheme == "https") {
        result.port = 443;
    } else {
        return std::unexpected("Unsupported scheme '" + result.scheme + "' in server URL: " + url);
    }

    auto authority_begin = scheme_end + 3;
    auto path_begin = url.find('/', authority_begin);
    std::string authority = url.substr(authority_begin, path_begin - authority_begin);
    if (path_begin != std::string::npos) {
        result.base_path = url.substr(path_begin);
    }

    // Bracketed IPv6 literal: [::1]:8080
    std::string::size_type port_sep = std::string::npos;
    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string::npos) {
            return std::unexpected("Unterminated IPv6 address in server URL: " + url);
        }
        result.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') {
                return std::unexpected("Malformed authority in server URL: " + url);
            }
            port_sep = close + 1;
        }
    } else {
        port_sep = authority.rfind(':');
        result.host = authority.substr(0, port_sep);
    }

    if (result.host.empty()) {
        return std::unexpected("Missing host in server URL: " + url);
    }

    if (port_sep != std::string::npos) {
        std::string port_str = authority.substr(port_sep + 1);
        unsigned value = 0;
        auto [ptr, ec] = std::from_chars(port_str.data(), port_str.data() + port_str.size(), value);
        if (port_str.empty() || ec != std::errc() || ptr != port_str.data() + port_str.size() ||
            value == 0 || value > 65535) {
            return std::unexpected("Invalid port in server URL: " + url);
        }
        result.port = static_cast<uint16_t>(value);
    }

    return result;
}

} // namespace hc
