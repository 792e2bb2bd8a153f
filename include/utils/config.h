#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace ksboot {

/// Upper bound for a single probe's connect timeout, in milliseconds.
constexpr long long kMaxProbeTimeoutMs = 600000;

struct BootstrapConfig {
    std::string host{"127.0.0.1"};           // probe and redirect target
    uint16_t port{3000};                     // fixed local server port
    std::string bind_hostname{"0.0.0.0"};    // HOSTNAME passed to the server
    std::string resource_dir;                // empty = platform default next to the executable
    std::string runtime_command;             // empty = platform default (node / node.exe)
    std::string manifest_file{"package.json"};
    std::vector<std::string> dev_tools{"bun", "npm"};
    std::chrono::milliseconds probe_timeout{1000};
    std::chrono::milliseconds poll_interval{500};
    int max_poll_attempts{120};
    std::chrono::milliseconds startup_delay{500};
    std::chrono::milliseconds terminate_grace{2000};
    std::string health_path;                 // empty = TCP connect probe
    uint16_t status_port{0};                 // 0 = status server disabled
    bool open_browser{true};
};

BootstrapConfig loadBootstrapConfig();
std::pair<BootstrapConfig, std::string> loadBootstrapConfigWithLog();

}  // namespace ksboot
