#pragma once

#include "hc/load_balancer.hpp"
#include <chrono>
#include <expected>
#include <map>
#include <memory>
#include <string>

namespace hc {

constexpr std::chrono::milliseconds kDefaultRequestTimeout{5000};

// Health check policy of one backend. Immutable once handed to the registry.
struct BackendHealthCheck {
    std::string path;
    std::chrono::milliseconds interval{0};
    std::chrono::milliseconds request_timeout{kDefaultRequestTimeout};
    std::shared_ptr<LoadBalancer> load_balancer;

    std::expected<void, std::string> validate() const;

    std::string to_string() const;
};

// Backend name -> policy; a new set fully replaces the previous one
using MonitoredBackendSet = std::map<std::string, BackendHealthCheck>;

} // namespace hc
