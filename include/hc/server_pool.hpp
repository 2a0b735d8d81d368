#pragma once

#include "hc/load_balancer.hpp"
#include <vector>
#include <optional>
#include <shared_mutex>
#include <string>

namespace hc {

struct PoolMember {
    std::string url;
    unsigned weight;
};

// In-process live list for one backend
class ServerPool : public LoadBalancer {
public:
    ServerPool() = default;
    explicit ServerPool(const std::vector<std::string>& urls);

    // Get all live server URLs in insertion order (read lock)
    std::vector<std::string> servers() const override;

    // Insert or reweight a server (write lock)
    std::expected<void, std::string> upsert_server(const std::string& url, unsigned weight) override;

    // Drop a server if present (write lock)
    std::expected<void, std::string> remove_server(const std::string& url) override;

    std::optional<unsigned> weight(const std::string& url) const;

    size_t size() const;

private:
    std::vector<PoolMember> members_;
    mutable std::shared_mutex mutex_;
};

} // namespace hc
