#include "hc/backend_pools.hpp"
#include "hc/config_loader.hpp"
#include "hc/health_check.hpp"
#include "hc/logger.hpp"
#include <atomic>
#include <csignal>
#include <iostream>
#include <thread>
#include <spdlog/fmt/fmt.h>

using namespace hc;

std::atomic<bool> shutdown_requested{false};
std::atomic<bool> reload_requested{false};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        shutdown_requested.store(true);
    } else if (signal == SIGHUP) {
        reload_requested.store(true);
    }
}

int main(int argc, char* argv[]) {
    if (argc > 2) {
        std::cerr << "Usage: " << argv[0] << " [config.json]" << std::endl;
        return 1;
    }
    std::string config_path = argc == 2 ? argv[1] : "config.json";

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGHUP, signal_handler);

    auto config_result = ConfigLoader::load(config_path);
    if (!config_result.has_value()) {
        std::cerr << "Failed to load configuration: " << config_result.error() << std::endl;
        return 1;
    }

    Config config = config_result.value();

    Logger::init(config.logging.log_file, config.logging.log_level);
    Logger::info(Logger::Component::Config,
        fmt::format("Loaded {} backend(s) from {}", config.backends.size(), config_path));

    HealthCheck health_check;
    BackendPools pools;

    auto started = pools.apply(config, health_check);
    if (!started.has_value()) {
        Logger::error(Logger::Component::Main, started.error());
        Logger::shutdown();
        return 1;
    }

    std::cout << "Health checker running, SIGHUP reloads " << config_path << "\n";
    std::cout << "Press Ctrl+C to stop\n";

    while (!shutdown_requested.load()) {
        if (reload_requested.exchange(false)) {
            Logger::info(Logger::Component::Config, "Reloading configuration");
            auto reloaded = ConfigLoader::load(config_path);
            if (!reloaded.has_value()) {
                Logger::error(Logger::Component::Config,
                    "Reload failed, keeping current configuration: " + reloaded.error());
                continue;
            }
            auto applied = pools.apply(*reloaded, health_check);
            if (!applied.has_value()) {
                Logger::error(Logger::Component::Config, applied.error());
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    std::cout << "\nShutting down gracefully...\n";
    Logger::info(Logger::Component::Main, "Shutting down gracefully");

    health_check.shutdown();
    Logger::shutdown();

    std::cout << "Shutdown complete\n";
    return 0;
}
