#include "hc/backend_pools.hpp"
#include "hc/logger.hpp"
#include <algorithm>
#include <spdlog/fmt/fmt.h>

namespace hc {

std::expected<void, std::string> BackendPools::apply(const Config& config, HealthCheck& health_check) {
    MonitoredBackendSet backends;

    for (const auto& [name, backend] : config.backends) {
        auto& pool = pools_[name];
        if (!pool) {
            pool = std::make_shared<ServerPool>();
        }

        BackendHealthCheck check;
        check.path = backend.path;
        check.interval = backend.interval;
        check.request_timeout = backend.timeout;
        check.load_balancer = pool;

        auto valid = check.validate();
        if (!valid.has_value()) {
            return std::unexpected(fmt::format("Backend {}: {}", name, valid.error()));
        }
        backends.emplace(name, std::move(check));
    }

    // A superseded pass may still upsert or remove; it must finish before
    // membership is reset or it would undo the reset.
    health_check.stop();
    health_check.wait_stopped();

    for (const auto& [name, backend] : config.backends) {
        reset_membership(name, backend);
    }
    std::erase_if(pools_, [&](const auto& entry) { return !config.backends.contains(entry.first); });

    return health_check.set_backends_configuration(std::move(backends));
}

std::shared_ptr<ServerPool> BackendPools::pool(const std::string& name) const {
    auto it = pools_.find(name);
    return it == pools_.end() ? nullptr : it->second;
}

void BackendPools::reset_membership(const std::string& name, const BackendConfig& backend) {
    auto& pool = *pools_.at(name);

    for (const auto& url : pool.servers()) {
        if (std::find(backend.servers.begin(), backend.servers.end(), url) == backend.servers.end()) {
            auto removed = pool.remove_server(url);
            if (!removed.has_value()) {
                Logger::warn(Logger::Component::Pool,
                    fmt::format("Backend {}: {}", name, removed.error()));
            }
        }
    }
    for (const auto& url : backend.servers) {
        auto added = pool.upsert_server(url, 1);
        if (!added.has_value()) {
            Logger::warn(Logger::Component::Pool,
                fmt::format("Backend {}: {}", name, added.error()));
        }
    }
}

} // namespace hc
