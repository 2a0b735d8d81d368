#include "hc/probe.hpp"
#include "hc/server_url.hpp"
#include "hc/logger.hpp"
#include <httplib.h>
#include <spdlog/fmt/fmt.h>

namespace hc {

bool probe(const std::string& server_url, const std::string& path,
           std::chrono::milliseconds timeout) {
    auto parsed = parse_server_url(server_url);
    if (!parsed.has_value()) {
        Logger::debug(Logger::Component::Probe, parsed.error());
        return false;
    }

    try {
        httplib::Client client(parsed->origin());
        if (!client.is_valid()) {
            Logger::debug(Logger::Component::Probe,
                fmt::format("No client available for {}", parsed->origin()));
            return false;
        }
        client.set_connection_timeout(timeout);
        client.set_read_timeout(timeout);
        client.set_write_timeout(timeout);
        // Whole-exchange deadline; the per-operation timeouts restart on every chunk
        client.set_max_timeout(timeout);
        client.set_keep_alive(false);

        // The result owns the response body; it is released when res goes out of scope
        auto res = client.Get(parsed->target(path));
        if (!res) {
            Logger::debug(Logger::Component::Probe,
                fmt::format("{}{}: {}", server_url, path, httplib::to_string(res.error())));
            return false;
        }

        if (res->status != 200) {
            Logger::debug(Logger::Component::Probe,
                fmt::format("{}{}: status {}", server_url, path, res->status));
            return false;
        }

        return true;

    } catch (const std::exception& e) {
        Logger::debug(Logger::Component::Probe,
            fmt::format("{}{} probe exception: {}", server_url, path, e.what()));
        return false;
    }
}

} // namespace hc
