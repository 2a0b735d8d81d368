#pragma once

#include <chrono>
#include <expected>
#include <map>
#include <string>
#include <vector>

namespace hc {

struct LoggingConfig {
    std::string log_file;
    std::string log_level;
};

struct BackendConfig {
    std::string path;
    std::chrono::milliseconds interval;
    std::chrono::milliseconds timeout;
    std::vector<std::string> servers;
};

struct Config {
    LoggingConfig logging;
    std::map<std::string, BackendConfig> backends;
};

class ConfigLoader {
public:
    static std::expected<Config, std::string> load(const std::string& config_path);

    static std::expected<Config, std::string> parse_config(const std::string& content);

private:
    static std::expected<void, std::string> validate_config(const Config& config);
};

} // namespace hc
