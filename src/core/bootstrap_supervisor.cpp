#include "core/bootstrap_supervisor.h"

#include "utils/config.h"

#include <spdlog/spdlog.h>
#include <sstream>
#include <system_error>

namespace ksboot {

std::string bootstrapStateToString(BootstrapState state) {
    switch (state) {
        case BootstrapState::Idle: return "idle";
        case BootstrapState::ProbingExisting: return "probing";
        case BootstrapState::Launching: return "launching";
        case BootstrapState::Polling: return "polling";
        case BootstrapState::Ready: return "ready";
        case BootstrapState::Failed: return "failed";
        default: return "unknown";
    }
}

SupervisorOptions SupervisorOptions::fromConfig(const BootstrapConfig& config) {
    SupervisorOptions options;
    options.host = config.host;
    options.port = config.port;
    options.probe_timeout = config.probe_timeout;
    options.poll_interval = config.poll_interval;
    options.max_poll_attempts = config.max_poll_attempts;
    options.startup_delay = config.startup_delay;
    return options;
}

BootstrapSupervisor::BootstrapSupervisor(SupervisorOptions options,
                                         LaunchPlanInput plan,
                                         HealthProbe& probe,
                                         ProcessLauncher& launcher,
                                         WindowHandle& window,
                                         ReadinessTracker& readiness,
                                         ProcessHandle& process)
    : options_(std::move(options)),
      plan_(std::move(plan)),
      probe_(probe),
      launcher_(launcher),
      window_(window),
      readiness_(readiness),
      process_(process) {
    plan_.port = options_.port;
}

BootstrapSupervisor::~BootstrapSupervisor() { shutdown(); }

void BootstrapSupervisor::start() {
    std::lock_guard<std::mutex> lock(join_mutex_);
    if (started_.exchange(true)) {
        return;
    }
    thread_ = std::thread([this]() { run(); });
}

void BootstrapSupervisor::run() {
    if (state_.load() != BootstrapState::Idle) {
        spdlog::warn("Bootstrap already ran (state: {})", bootstrapStateToString(state_.load()));
        return;
    }
    try {
        runSequence();
    } catch (const std::exception& e) {
        fail(std::string("unexpected error: ") + e.what());
    }
}

void BootstrapSupervisor::runSequence() {
    transition(BootstrapState::ProbingExisting);
    if (probe_.probe(options_.host, options_.port, options_.probe_timeout)) {
        spdlog::info("Server already listening on {}:{}, not launching another",
                     options_.host, options_.port);
        becomeReady();
        return;
    }

    if (!sleepFor(options_.startup_delay)) {
        fail("shutdown requested before launch");
        return;
    }

    transition(BootstrapState::Launching);
    auto attempts = planLaunchAttempts(plan_);
    if (attempts.empty()) {
        fail("could not start server: no runtime, server script or " + plan_.manifest_file + " found");
        return;
    }

    LaunchStrategyChain chain(launcher_);
    auto launched = chain.launch(attempts);
    if (!launched) {
        std::ostringstream reason;
        reason << "could not start server";
        for (const auto& failure : chain.failures()) {
            reason << "; " << failure;
        }
        fail(reason.str());
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        launch_method_ = launched->attempt.method;
    }
    if (!process_.store(std::move(launched->process))) {
        fail("shutdown requested during launch");
        return;
    }

    transition(BootstrapState::Polling);
    spdlog::info("Waiting for server on {}:{} (every {}ms, up to {} attempts)",
                 options_.host, options_.port, options_.poll_interval.count(),
                 options_.max_poll_attempts);

    bool exit_reported = false;
    for (int attempt = 1; attempt <= options_.max_poll_attempts; ++attempt) {
        if (stopping()) {
            fail("shutdown requested while waiting for server");
            return;
        }
        poll_attempts_.store(attempt);
        if (probe_.probe(options_.host, options_.port, options_.probe_timeout)) {
            spdlog::info("Server is ready after {} attempts", attempt);
            becomeReady();
            return;
        }
        spdlog::debug("Server not ready yet (attempt {}/{})", attempt, options_.max_poll_attempts);

        if (!exit_reported && !process_.isRunning()) {
            exit_reported = true;
            if (auto code = process_.exitCode()) {
                spdlog::warn("Server process exited with code {} before becoming ready", *code);
            }
        }

        if (attempt < options_.max_poll_attempts && !sleepFor(options_.poll_interval)) {
            fail("shutdown requested while waiting for server");
            return;
        }
    }

    // The process stays up: it may still come up, but the window is not redirected.
    auto waited = options_.poll_interval * (options_.max_poll_attempts - 1);
    fail("server startup timed out after " + std::to_string(options_.max_poll_attempts) +
         " attempts (~" + std::to_string(waited.count()) + "ms)");
}

void BootstrapSupervisor::transition(BootstrapState next) {
    auto prev = state_.exchange(next);
    spdlog::debug("Bootstrap {} -> {}", bootstrapStateToString(prev), bootstrapStateToString(next));
    if (next == BootstrapState::Ready || next == BootstrapState::Failed) {
        std::lock_guard<std::mutex> lock(mutex_);
        cv_.notify_all();
    }
}

void BootstrapSupervisor::becomeReady() {
    const bool first = readiness_.markReady();
    transition(BootstrapState::Ready);
    if (!first) {
        return;
    }
    const std::string url = serverUrl();
    try {
        window_.navigate(url);
    } catch (const std::exception& e) {
        spdlog::error("Navigating window to {} failed: {}", url, e.what());
    }
}

void BootstrapSupervisor::fail(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        failure_reason_ = reason;
    }
    transition(BootstrapState::Failed);

    if (stopping()) {
        spdlog::info("Bootstrap stopped: {}", reason);
        return;
    }
    spdlog::error("Bootstrap failed: {}", reason);
    try {
        window_.showFailure(reason);
    } catch (const std::exception& e) {
        spdlog::error("Reporting failure to window failed: {}", e.what());
    }
}

bool BootstrapSupervisor::sleepFor(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(mutex_);
    return !cv_.wait_for(lock, duration, [this]() { return stop_requested_; });
}

bool BootstrapSupervisor::stopping() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stop_requested_;
}

void BootstrapSupervisor::shutdown() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();

    process_.terminate();

    std::lock_guard<std::mutex> lock(join_mutex_);
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        try {
            thread_.join();
        } catch (const std::system_error& e) {
            spdlog::debug("Joining bootstrap thread failed: {}", e.what());
        }
    }
}

bool BootstrapSupervisor::waitUntilSettled(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this]() {
        auto s = state_.load();
        return s == BootstrapState::Ready || s == BootstrapState::Failed;
    });
}

std::string BootstrapSupervisor::failureReason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failure_reason_;
}

std::string BootstrapSupervisor::serverUrl() const {
    return "http://localhost:" + std::to_string(options_.port);
}

std::optional<LaunchMethod> BootstrapSupervisor::launchMethod() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return launch_method_;
}

}  // namespace ksboot
