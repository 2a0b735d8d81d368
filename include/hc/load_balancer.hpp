#pragma once

#include <string>
#include <vector>
#include <expected>

namespace hc {

// Mutation surface of a backend's live server list. Implementations must be
// safe for concurrent use; several monitors may share one instance.
class LoadBalancer {
public:
    virtual ~LoadBalancer() = default;

    // Current authoritative live list
    virtual std::vector<std::string> servers() const = 0;

    // Adding a present server updates its weight, never duplicates it
    virtual std::expected<void, std::string> upsert_server(const std::string& url, unsigned weight) = 0;

    // Removing an absent server is not an error
    virtual std::expected<void, std::string> remove_server(const std::string& url) = 0;
};

} // namespace hc
