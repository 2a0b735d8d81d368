#include "hc/config_loader.hpp"
#include "hc/backend_health_check.hpp"
#include "hc/server_url.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace hc {

std::expected<Config, std::string> ConfigLoader::load(const std::string& config_path) {
    // Try multiple locations for the config file
    std::vector<std::string> search_paths = {
        config_path,                           // Current directory
        "../" + config_path,                   // Parent directory (for build dirs)
        "../../" + config_path                 // Two levels up (for nested builds)
    };

    std::ifstream file;

    for (const auto& path : search_paths) {
        file.open(path);
        if (file.is_open()) {
            break;
        }
        file.clear(); // Clear error flags before next attempt
    }

    if (!file.is_open()) {
        return std::unexpected("Failed to open config file: " + config_path +
                             " (searched in: ., .., ../..)");
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    return parse_config(buffer.str());
}

std::expected<Config, std::string> ConfigLoader::parse_config(const std::string& content) {
    try {
        json j = json::parse(content);

        Config config;

        auto logging = j.value("logging", json::object());
        config.logging.log_file = logging.value("log_file", "healthcheck.log");
        config.logging.log_level = logging.value("log_level", "INFO");

        if (!j.contains("backends")) {
            return std::unexpected("Missing 'backends' section");
        }
        const auto& backends = j["backends"];
        if (!backends.is_object()) {
            return std::unexpected("'backends' must be an object keyed by backend name");
        }

        for (const auto& [name, backend] : backends.items()) {
            if (!backend.contains("interval_ms")) {
                return std::unexpected(fmt::format("Backend {}: missing 'interval_ms'", name));
            }

            BackendConfig bc;
            bc.path = backend.value("path", "");
            bc.interval = std::chrono::milliseconds(backend["interval_ms"].get<int64_t>());
            bc.timeout = std::chrono::milliseconds(
                backend.value("timeout_ms", static_cast<int64_t>(kDefaultRequestTimeout.count())));
            bc.servers = backend.value("servers", std::vector<std::string>{});
            config.backends.emplace(name, std::move(bc));
        }

        auto valid = validate_config(config);
        if (!valid.has_value()) {
            return std::unexpected(valid.error());
        }

        return config;

    } catch (const json::exception& e) {
        return std::unexpected(std::string("JSON parsing error: ") + e.what());
    }
}

std::expected<void, std::string> ConfigLoader::validate_config(const Config& config) {
    for (const auto& [name, backend] : config.backends) {
        if (backend.interval.count() <= 0) {
            return std::unexpected(fmt::format("Backend {}: 'interval_ms' must be positive", name));
        }

        if (backend.timeout.count() <= 0) {
            return std::unexpected(fmt::format("Backend {}: 'timeout_ms' must be positive", name));
        }

        for (auto it = backend.servers.begin(); it != backend.servers.end(); ++it) {
            auto parsed = parse_server_url(*it);
            if (!parsed.has_value()) {
                return std::unexpected(fmt::format("Backend {}: {}", name, parsed.error()));
            }
            if (std::find(backend.servers.begin(), it, *it) != it) {
                return std::unexpected(fmt::format("Backend {}: duplicate server {}", name, *it));
            }
        }
    }

    return {};
}

} // namespace hc
