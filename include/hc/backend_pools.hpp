#pragma once

#include "hc/config_loader.hpp"
#include "hc/health_check.hpp"
#include "hc/server_pool.hpp"
#include <expected>
#include <map>
#include <memory>
#include <string>

namespace hc {

// Server pools of the configured backends, kept across reloads so whoever
// routes through a pool keeps a valid reference. Not thread-safe; driven
// from the thread that handles configuration.
class BackendPools {
public:
    // Stops and joins the running monitors before pool membership is reset to
    // the configured lists, then starts monitors for the new configuration.
    std::expected<void, std::string> apply(const Config& config, HealthCheck& health_check);

    std::shared_ptr<ServerPool> pool(const std::string& name) const;

    size_t size() const { return pools_.size(); }

private:
    void reset_membership(const std::string& name, const BackendConfig& backend);

    std::map<std::string, std::shared_ptr<ServerPool>> pools_;
};

} // namespace hc
