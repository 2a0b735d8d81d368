#pragma once

#include "hc/load_balancer.hpp"
#include "hc/probe.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace hc::test {

// Live list that records every call and can be told to fail mutations
class FakeLoadBalancer : public LoadBalancer {
public:
    explicit FakeLoadBalancer(std::vector<std::string> urls = {}) : servers_(std::move(urls)) {}

    std::vector<std::string> servers() const override {
        std::lock_guard lock(mutex_);
        ++servers_calls_;
        return servers_;
    }

    std::expected<void, std::string> upsert_server(const std::string& url, unsigned weight) override {
        std::lock_guard lock(mutex_);
        ++mutations_;
        upsert_weights_.push_back(weight);
        if (fail_upsert_) {
            return std::unexpected("upsert refused");
        }
        if (std::find(servers_.begin(), servers_.end(), url) == servers_.end()) {
            servers_.push_back(url);
        }
        return {};
    }

    std::expected<void, std::string> remove_server(const std::string& url) override {
        std::lock_guard lock(mutex_);
        ++mutations_;
        if (fail_remove_) {
            return std::unexpected("remove refused");
        }
        std::erase(servers_, url);
        return {};
    }

    std::set<std::string> live() const {
        std::lock_guard lock(mutex_);
        return {servers_.begin(), servers_.end()};
    }

    size_t live_count() const {
        std::lock_guard lock(mutex_);
        return servers_.size();
    }

    int servers_calls() const {
        std::lock_guard lock(mutex_);
        return servers_calls_;
    }

    int mutations() const {
        std::lock_guard lock(mutex_);
        return mutations_;
    }

    std::vector<unsigned> upsert_weights() const {
        std::lock_guard lock(mutex_);
        return upsert_weights_;
    }

    void set_fail_upsert(bool fail) {
        std::lock_guard lock(mutex_);
        fail_upsert_ = fail;
    }

    void set_fail_remove(bool fail) {
        std::lock_guard lock(mutex_);
        fail_remove_ = fail;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> servers_;
    mutable int servers_calls_ = 0;
    int mutations_ = 0;
    std::vector<unsigned> upsert_weights_;
    bool fail_upsert_ = false;
    bool fail_remove_ = false;
};

// Probe whose verdict per URL is set by the test; unknown URLs are healthy
class ScriptedProbe {
public:
    void set_healthy(const std::string& url, bool healthy) {
        std::lock_guard lock(mutex_);
        healthy_[url] = healthy;
    }

    int calls(const std::string& url) const {
        std::lock_guard lock(mutex_);
        auto it = calls_.find(url);
        return it == calls_.end() ? 0 : it->second;
    }

    int total_calls() const {
        std::lock_guard lock(mutex_);
        int total = 0;
        for (const auto& [url, count] : calls_) {
            total += count;
        }
        return total;
    }

    std::vector<std::string> paths() const {
        std::lock_guard lock(mutex_);
        return paths_;
    }

    ProbeFunction function() {
        return [this](const std::string& url, const std::string& path, std::chrono::milliseconds) {
            std::lock_guard lock(mutex_);
            ++calls_[url];
            paths_.push_back(path);
            auto it = healthy_.find(url);
            return it == healthy_.end() || it->second;
        };
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, bool> healthy_;
    std::map<std::string, int> calls_;
    std::vector<std::string> paths_;
};

// Poll until condition holds or the deadline passes
template <typename Pred>
bool wait_for(Pred pred, std::chrono::milliseconds deadline = std::chrono::milliseconds(2000)) {
    auto until = std::chrono::steady_clock::now() + deadline;
    while (std::chrono::steady_clock::now() < until) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

} // namespace hc::test
