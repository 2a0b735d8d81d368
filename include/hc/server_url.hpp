#pragma once

#include <string>
#include <expected>
#include <cstdint>

namespace hc {

struct ServerUrl {
    std::string scheme;
    std::string host;
    uint16_t port;
    std::string base_path;

    // scheme://host:port, as expected by httplib::Client
    std::string origin() const;

    // Request target for a probe path, never empty
    std::string target(const std::string& path) const;
};

// Parse an absolute http(s) base address such as "http://10.0.0.1:8080/app"
std::expected<ServerUrl, std::string> parse_server_url(const std::string& url);

} // namespace hc
