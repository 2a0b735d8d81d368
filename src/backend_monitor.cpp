#include "hc/backend_monitor.hpp"
#include "hc/logger.hpp"
#include <algorithm>
#include <unordered_set>
#include <spdlog/fmt/fmt.h>

namespace hc {

BackendMonitor::BackendMonitor(std::string name, BackendHealthCheck config,
                               ProbeFunction probe_fn)
    : name_(std::move(name)), config_(std::move(config)), probe_fn_(std::move(probe_fn)) {}

void BackendMonitor::run(std::stop_token stop_token) {
    if (stop_token.stop_requested()) {
        return;
    }

    Logger::debug(Logger::Component::Monitor,
        fmt::format("Initial health check for backend {} {}", name_, config_.to_string()));
    check_backend();

    auto next_tick = std::chrono::steady_clock::now() + config_.interval;

    while (true) {
        {
            std::unique_lock lock(wait_mutex_);
            wait_cv_.wait_until(lock, stop_token, next_tick, [] { return false; });
        }
        if (stop_token.stop_requested()) {
            break;
        }

        Logger::debug(Logger::Component::Monitor,
            fmt::format("Refreshing health check for backend {}", name_));
        check_backend();

        // Fixed rate; an overrun yields one immediate tick, not a burst
        next_tick += config_.interval;
        auto now = std::chrono::steady_clock::now();
        if (next_tick < now) {
            next_tick = now;
        }
    }

    Logger::debug(Logger::Component::Monitor,
        fmt::format("Stopping health check for backend {}", name_));
}

void BackendMonitor::check_backend() {
    auto& lb = *config_.load_balancer;
    auto enabled_servers = lb.servers();

    std::unordered_set<std::string> checked;
    std::vector<std::string> still_disabled;
    still_disabled.reserve(disabled_servers_.size());

    for (const auto& url : disabled_servers_) {
        if (!checked.insert(url).second) {
            continue;
        }
        if (is_healthy(url)) {
            auto result = lb.upsert_server(url, 1);
            if (!result.has_value()) {
                Logger::warn(Logger::Component::Monitor,
                    fmt::format("Backend {}: failed to re-enable {}: {}", name_, url, result.error()));
                still_disabled.push_back(url);
                continue;
            }
            Logger::info(Logger::Component::Monitor,
                fmt::format("Backend {}: {} is up, added back to server list", name_, url));
        } else {
            Logger::warn(Logger::Component::Monitor,
                fmt::format("Backend {}: {} is still failing", name_, url));
            still_disabled.push_back(url);
        }
    }
    disabled_servers_ = std::move(still_disabled);

    for (const auto& url : enabled_servers) {
        if (checked.contains(url)) {
            // Already probed this pass; a URL that failed above must not stay live
            if (is_disabled(url)) {
                auto result = lb.remove_server(url);
                if (!result.has_value()) {
                    Logger::warn(Logger::Component::Monitor,
                        fmt::format("Backend {}: failed to remove {}: {}", name_, url, result.error()));
                }
            }
            continue;
        }
        checked.insert(url);

        if (is_healthy(url)) {
            continue;
        }

        Logger::warn(Logger::Component::Monitor,
            fmt::format("Backend {}: health check failed for {}, removing from server list", name_, url));
        auto result = lb.remove_server(url);
        if (!result.has_value()) {
            Logger::warn(Logger::Component::Monitor,
                fmt::format("Backend {}: failed to remove {}: {}", name_, url, result.error()));
        }
        disabled_servers_.push_back(url);
    }
}

bool BackendMonitor::is_healthy(const std::string& url) const {
    return probe_fn_(url, config_.path, config_.request_timeout);
}

bool BackendMonitor::is_disabled(const std::string& url) const {
    return std::find(disabled_servers_.begin(), disabled_servers_.end(), url) != disabled_servers_.end();
}

} // namespace hc
