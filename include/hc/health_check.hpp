#pragma once

#include "hc/backend_health_check.hpp"
#include "hc/backend_monitor.hpp"
#include "hc/probe.hpp"
#include <atomic>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace hc {

// Registry of the monitored backends. Each configuration push starts a new
// generation of monitor threads and cancels the previous one.
class HealthCheck {
public:
    explicit HealthCheck(ProbeFunction probe_fn = probe);

    ~HealthCheck();

    HealthCheck(const HealthCheck&) = delete;
    HealthCheck& operator=(const HealthCheck&) = delete;

    // Validates every entry first; an invalid set is rejected as a whole and
    // the running generation is left untouched.
    std::expected<void, std::string> set_backends_configuration(MonitoredBackendSet backends);

    // Same, with the new generation also cancelled when parent is stopped
    std::expected<void, std::string> set_backends_configuration(std::stop_token parent,
                                                                MonitoredBackendSet backends);

    // Signal the current generation without waiting
    void stop();

    // Join every generation that has been cancelled. Cancelled generations whose
    // threads already returned are also dropped on the next reconfiguration.
    void wait_stopped();

    // stop() followed by joining all monitor threads
    void shutdown();

    std::vector<std::string> backend_names() const;

    size_t running_monitors() const;

    // Cancelled generations not yet joined
    size_t retired_generations() const;

private:
    using StopLink = std::stop_callback<std::function<void()>>;

    struct Generation {
        std::stop_source stop_source;
        std::unique_ptr<StopLink> parent_link;
        std::shared_ptr<std::atomic<size_t>> live_threads;
        std::vector<std::jthread> threads;
    };

    void retire_current();

    ProbeFunction probe_fn_;
    MonitoredBackendSet backends_;
    std::optional<Generation> current_;
    std::vector<Generation> retired_;
    mutable std::mutex mutex_;
};

} // namespace hc
