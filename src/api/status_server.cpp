#include "api/status_server.h"

#include "core/bootstrap_supervisor.h"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace ksboot {

StatusServer::StatusServer(int port, const BootstrapSupervisor& supervisor, std::string bind_address)
    : port_(port), bind_address_(std::move(bind_address)), supervisor_(supervisor) {}

StatusServer::~StatusServer() { stop(); }

void StatusServer::applyCors(httplib::Response& res) {
    if (!enable_cors_) return;
    if (!res.has_header("Access-Control-Allow-Origin"))
        res.set_header("Access-Control-Allow-Origin", cors_allow_origin_.c_str());
    if (!res.has_header("Access-Control-Allow-Methods"))
        res.set_header("Access-Control-Allow-Methods", cors_allow_methods_.c_str());
    if (!res.has_header("Access-Control-Allow-Headers"))
        res.set_header("Access-Control-Allow-Headers", cors_allow_headers_.c_str());
}

void StatusServer::registerRoutes() {
    server_.Get("/health", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(nlohmann::json{{"status", "ok"}}.dump(), "application/json");
    });

    server_.Get("/api/server/ready", [this](const httplib::Request&, httplib::Response& res) {
        nlohmann::json body = {{"ready", supervisor_.isReady()}};
        res.set_content(body.dump(), "application/json");
    });

    server_.Get("/api/server/status", [this](const httplib::Request&, httplib::Response& res) {
        nlohmann::json body = {
            {"state", bootstrapStateToString(supervisor_.state())},
            {"ready", supervisor_.isReady()},
            {"url", supervisor_.serverUrl()},
            {"attempts", supervisor_.pollAttempts()},
        };
        if (auto pid = supervisor_.serverPid()) {
            body["pid"] = *pid;
        } else {
            body["pid"] = nullptr;
        }
        if (auto method = supervisor_.launchMethod()) {
            body["method"] = launchMethodToString(*method);
        } else {
            body["method"] = nullptr;
        }
        auto error = supervisor_.failureReason();
        if (error.empty()) {
            body["error"] = nullptr;
        } else {
            body["error"] = error;
        }
        res.set_content(body.dump(), "application/json");
    });
}

bool StatusServer::start() {
    if (running_) return true;

    server_.set_pre_routing_handler([this](const httplib::Request& req, httplib::Response& res) {
        if (enable_cors_) {
            applyCors(res);
            if (req.method == "OPTIONS") {
                res.status = 204;
                return httplib::Server::HandlerResponse::Handled;
            }
        }
        return httplib::Server::HandlerResponse::Unhandled;
    });

    server_.set_post_routing_handler([this](const httplib::Request&, httplib::Response& res) {
        applyCors(res);
    });

    if (logger_) {
        server_.set_logger([this](const httplib::Request& req, const httplib::Response& res) {
            logger_(req, res);
        });
    }

    server_.set_error_handler([](const httplib::Request& req, httplib::Response& res) {
        if (!res.body.empty()) {
            if (!res.has_header("Content-Type")) {
                res.set_header("Content-Type", "text/plain");
            }
            return;
        }
        nlohmann::json body = {
            {"error", res.status == 404 ? "not_found" : "http_error"},
            {"status", res.status},
            {"path", req.path}
        };
        res.set_content(body.dump(), "application/json");
    });

    registerRoutes();

    if (port_ == 0) {
        int bound = server_.bind_to_any_port(bind_address_.c_str());
        if (bound <= 0) {
            spdlog::error("Status server cannot bind {}:<any>", bind_address_);
            return false;
        }
        port_ = bound;
    } else if (!server_.bind_to_port(bind_address_.c_str(), port_)) {
        spdlog::error("Status server cannot bind {}:{}", bind_address_, port_);
        return false;
    }

    running_ = true;
    thread_ = std::thread([this]() { server_.listen_after_bind(); });
    while (!server_.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    spdlog::info("Status server listening on http://{}:{}", bind_address_, port_);
    return true;
}

void StatusServer::stop() {
    if (!running_) return;
    server_.stop();
    if (thread_.joinable()) thread_.join();
    running_ = false;
}

}  // namespace ksboot
