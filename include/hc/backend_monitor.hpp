#pragma once

#include "hc/backend_health_check.hpp"
#include "hc/probe.hpp"
#include <condition_variable>
#include <mutex>
#include <stop_token>
#include <string>
#include <vector>

namespace hc {

// Monitoring loop of a single backend. The disabled set belongs to the thread
// running run(); read it only from that thread or after it has been joined.
class BackendMonitor {
public:
    BackendMonitor(std::string name, BackendHealthCheck config,
                   ProbeFunction probe_fn = probe);

    // Immediate pass, then one pass per interval until stop is requested
    void run(std::stop_token stop_token);

    // One reconciliation pass over the disabled set and the live list
    void check_backend();

    const std::vector<std::string>& disabled_servers() const { return disabled_servers_; }

    const std::string& name() const { return name_; }
    const BackendHealthCheck& config() const { return config_; }

private:
    bool is_healthy(const std::string& url) const;
    bool is_disabled(const std::string& url) const;

    std::string name_;
    const BackendHealthCheck config_;
    ProbeFunction probe_fn_;
    std::vector<std::string> disabled_servers_;

    // Only used to sleep between passes
    std::mutex wait_mutex_;
    std::condition_variable_any wait_cv_;
};

} // namespace hc
