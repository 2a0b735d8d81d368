#include "hc/server_pool.hpp"
#include "hc/server_url.hpp"
#include "hc/logger.hpp"
#include <algorithm>
#include <mutex>
#include <spdlog/fmt/fmt.h>

namespace hc {

ServerPool::ServerPool(const std::vector<std::string>& urls) {
    members_.reserve(urls.size());
    for (const auto& url : urls) {
        auto it = std::find_if(members_.begin(), members_.end(),
            [&](const PoolMember& m) { return m.url == url; });
        if (it == members_.end()) {
            members_.push_back({url, 1});
        }
    }
}

std::vector<std::string> ServerPool::servers() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> result;
    result.reserve(members_.size());
    for (const auto& member : members_) {
        result.push_back(member.url);
    }
    return result;
}

std::expected<void, std::string> ServerPool::upsert_server(const std::string& url, unsigned weight) {
    if (weight == 0) {
        return std::unexpected("Weight must be positive for server " + url);
    }
    auto parsed = parse_server_url(url);
    if (!parsed.has_value()) {
        return std::unexpected(parsed.error());
    }

    std::unique_lock lock(mutex_);
    auto it = std::find_if(members_.begin(), members_.end(),
        [&](const PoolMember& m) { return m.url == url; });
    if (it != members_.end()) {
        it->weight = weight;
        return {};
    }
    members_.push_back({url, weight});
    Logger::debug(Logger::Component::Pool, fmt::format("Added {} (weight {})", url, weight));
    return {};
}

std::expected<void, std::string> ServerPool::remove_server(const std::string& url) {
    std::unique_lock lock(mutex_);
    auto it = std::find_if(members_.begin(), members_.end(),
        [&](const PoolMember& m) { return m.url == url; });
    if (it != members_.end()) {
        members_.erase(it);
        Logger::debug(Logger::Component::Pool, fmt::format("Removed {}", url));
    }
    return {};
}

std::optional<unsigned> ServerPool::weight(const std::string& url) const {
    std::shared_lock lock(mutex_);
    auto it = std::find_if(members_.begin(), members_.end(),
        [&](const PoolMember& m) { return m.url == url; });
    if (it == members_.end()) {
        return std::nullopt;
    }
    return it->weight;
}

size_t ServerPool::size() const {
    std::shared_lock lock(mutex_);
    return members_.size();
}

} // namespace hc
