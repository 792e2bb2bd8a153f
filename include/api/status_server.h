#pragma once

#include <httplib.h>
#include <atomic>
#include <functional>
#include <string>
#include <thread>

namespace ksboot {

class BootstrapSupervisor;

using Logger = std::function<void(const httplib::Request&, const httplib::Response&)>;

/// Read-only HTTP surface through which the UI asks whether the local server is
/// up yet:
///   GET /health              -> {"status":"ok"}
///   GET /api/server/ready    -> {"ready":bool}
///   GET /api/server/status   -> {"state","ready","url","pid","attempts","method","error"}
class StatusServer {
public:
    StatusServer(int port, const BootstrapSupervisor& supervisor,
                 std::string bind_address = "127.0.0.1");
    ~StatusServer();

    /// Bind and serve on a background thread. Port 0 picks a free port.
    /// Returns false when the address cannot be bound.
    bool start();
    void stop();

    void enableCors(bool enable) { enable_cors_ = enable; }
    void setCorsOrigin(std::string origin) { cors_allow_origin_ = std::move(origin); }
    void setLogger(Logger logger) { logger_ = std::move(logger); }

    /// Bound port (the chosen one after start() when constructed with 0).
    int port() const { return port_; }

    httplib::Server& getServer() { return server_; }

private:
    void registerRoutes();
    void applyCors(httplib::Response& res);

    int port_;
    std::string bind_address_;
    const BootstrapSupervisor& supervisor_;
    httplib::Server server_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    bool enable_cors_{true};
    std::string cors_allow_origin_{"*"};
    std::string cors_allow_methods_{"GET, OPTIONS"};
    std::string cors_allow_headers_{"Content-Type"};
    Logger logger_{};
};

}  // namespace ksboot
