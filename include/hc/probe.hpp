#pragma once

#include <chrono>
#include <functional>
#include <string>

namespace hc {

// One GET against server_url + path. Healthy iff the exchange completes
// within timeout and the status is exactly 200. Never throws.
bool probe(const std::string& server_url, const std::string& path,
           std::chrono::milliseconds timeout);

using ProbeFunction = std::function<bool(const std::string& server_url, const std::string& path,
                                         std::chrono::milliseconds timeout)>;

} // namespace hc
