#include "hc/backend_health_check.hpp"
#include <spdlog/fmt/fmt.h>

namespace hc {

std::expected<void, std::string> BackendHealthCheck::validate() const {
    if (interval.count() <= 0) {
        return std::unexpected(fmt::format("interval must be positive, got {}ms", interval.count()));
    }
    if (request_timeout.count() <= 0) {
        return std::unexpected(fmt::format("request timeout must be positive, got {}ms",
                                           request_timeout.count()));
    }
    if (!load_balancer) {
        return std::unexpected("no load balancer attached");
    }
    return {};
}

std::string BackendHealthCheck::to_string() const {
    return fmt::format("[path: '{}' interval: {}ms timeout: {}ms]",
                       path, interval.count(), request_timeout.count());
}

} // namespace hc
