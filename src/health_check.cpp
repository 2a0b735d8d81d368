#include "hc/health_check.hpp"
#include "hc/logger.hpp"
#include <spdlog/fmt/fmt.h>

namespace hc {

HealthCheck::HealthCheck(ProbeFunction probe_fn)
    : probe_fn_(std::move(probe_fn)) {}

HealthCheck::~HealthCheck() {
    shutdown();
}

std::expected<void, std::string> HealthCheck::set_backends_configuration(MonitoredBackendSet backends) {
    return set_backends_configuration(std::stop_token{}, std::move(backends));
}

std::expected<void, std::string> HealthCheck::set_backends_configuration(std::stop_token parent,
                                                                         MonitoredBackendSet backends) {
    for (const auto& [name, backend] : backends) {
        auto valid = backend.validate();
        if (!valid.has_value()) {
            auto message = fmt::format("Backend {}: {}", name, valid.error());
            Logger::error(Logger::Component::Registry, "Configuration rejected: " + message);
            return std::unexpected(message);
        }
    }

    std::lock_guard lock(mutex_);

    backends_ = std::move(backends);
    retire_current();

    Generation generation;
    if (parent.stop_possible()) {
        generation.parent_link = std::make_unique<StopLink>(
            parent, [source = generation.stop_source]() mutable { source.request_stop(); });
    }

    generation.live_threads = std::make_shared<std::atomic<size_t>>(0);
    generation.threads.reserve(backends_.size());
    try {
        for (const auto& [name, backend] : backends_) {
            auto monitor = std::make_shared<BackendMonitor>(name, backend, probe_fn_);
            auto token = generation.stop_source.get_token();
            auto live = generation.live_threads;
            live->fetch_add(1);
            try {
                generation.threads.emplace_back([monitor, token, live]() {
                    monitor->run(token);
                    live->fetch_sub(1);
                });
            } catch (...) {
                live->fetch_sub(1);
                throw;
            }
        }
    } catch (const std::exception& e) {
        // The started monitors only watch the generation's token; signal it
        // before the threads are joined on unwind.
        generation.stop_source.request_stop();
        backends_.clear();
        Logger::error(Logger::Component::Registry,
            fmt::format("Failed to start monitors: {}", e.what()));
        return std::unexpected(std::string("Failed to start monitors: ") + e.what());
    }

    Logger::info(Logger::Component::Registry,
        fmt::format("Monitoring {} backend(s)", backends_.size()));

    current_ = std::move(generation);
    return {};
}

void HealthCheck::stop() {
    std::lock_guard lock(mutex_);
    retire_current();
}

void HealthCheck::wait_stopped() {
    std::vector<Generation> retired;
    {
        std::lock_guard lock(mutex_);
        retired.swap(retired_);
    }

    // Joined outside the lock so a concurrent reconfiguration is not blocked
    for (auto& generation : retired) {
        for (auto& thread : generation.threads) {
            if (thread.joinable()) {
                thread.join();
            }
        }
    }
    Logger::debug(Logger::Component::Registry,
        fmt::format("Joined {} cancelled generation(s)", retired.size()));
}

void HealthCheck::shutdown() {
    stop();
    wait_stopped();
}

std::vector<std::string> HealthCheck::backend_names() const {
    std::lock_guard lock(mutex_);
    std::vector<std::string> names;
    names.reserve(backends_.size());
    for (const auto& [name, backend] : backends_) {
        names.push_back(name);
    }
    return names;
}

size_t HealthCheck::retired_generations() const {
    std::lock_guard lock(mutex_);
    return retired_.size();
}

size_t HealthCheck::running_monitors() const {
    std::lock_guard lock(mutex_);
    return current_ ? current_->threads.size() : 0;
}

void HealthCheck::retire_current() {
    if (!current_) {
        return;
    }
    // Generations whose threads have all returned join without blocking
    std::erase_if(retired_, [](const Generation& generation) {
        return generation.live_threads->load() == 0;
    });

    Logger::debug(Logger::Component::Registry, "Stopping all current health check threads");
    current_->stop_source.request_stop();
    current_->parent_link.reset();
    retired_.push_back(std::move(*current_));
    current_.reset();
}

} // namespace hc
