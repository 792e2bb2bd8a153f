#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace ksboot {

struct BootstrapConfig;

/// "Is the local server accepting connections?" A failed probe is an expected
/// outcome while the server starts, so implementations never throw.
class HealthProbe {
public:
    virtual ~HealthProbe() = default;

    virtual bool probe(const std::string& host, uint16_t port,
                       std::chrono::milliseconds timeout) = 0;
};

/// Succeeds when a TCP connection to host:port completes within the timeout.
/// The connection is closed immediately afterwards.
class TcpHealthProbe : public HealthProbe {
public:
    bool probe(const std::string& host, uint16_t port,
               std::chrono::milliseconds timeout) override;
};

/// Succeeds when GET <path> returns any response below HTTP 500.
class HttpHealthProbe : public HealthProbe {
public:
    explicit HttpHealthProbe(std::string path);

    bool probe(const std::string& host, uint16_t port,
               std::chrono::milliseconds timeout) override;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

/// Timeout in whole milliseconds, clamped to [1, kMaxProbeTimeoutMs].
int probeTimeoutMillis(std::chrono::milliseconds timeout);

/// TCP probe unless the config names a health path.
std::unique_ptr<HealthProbe> makeHealthProbe(const BootstrapConfig& config);

}  // namespace ksboot
