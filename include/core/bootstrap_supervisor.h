#pragma once

#include "core/health_probe.h"
#include "core/launch_chain.h"
#include "core/process_handle.h"
#include "runtime/state.h"
#include "ui/window_handle.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace ksboot {

struct BootstrapConfig;

enum class BootstrapState {
    Idle,
    ProbingExisting,
    Launching,
    Polling,
    Ready,
    Failed,
};

std::string bootstrapStateToString(BootstrapState state);

struct SupervisorOptions {
    std::string host{"127.0.0.1"};
    uint16_t port{3000};
    std::chrono::milliseconds probe_timeout{1000};
    std::chrono::milliseconds poll_interval{500};
    int max_poll_attempts{120};
    std::chrono::milliseconds startup_delay{500};

    static SupervisorOptions fromConfig(const BootstrapConfig& config);
};

/// Brings the local server up once per process: probe for an existing server,
/// otherwise launch one through the strategy chain and poll until it answers,
/// then flip readiness and point the window at it.
///
/// The sequence runs on a single background thread started by start().
/// shutdown() is the teardown hook: it interrupts any wait, kills the server
/// process and joins the thread.
class BootstrapSupervisor {
public:
    BootstrapSupervisor(SupervisorOptions options,
                        LaunchPlanInput plan,
                        HealthProbe& probe,
                        ProcessLauncher& launcher,
                        WindowHandle& window,
                        ReadinessTracker& readiness,
                        ProcessHandle& process);
    ~BootstrapSupervisor();

    BootstrapSupervisor(const BootstrapSupervisor&) = delete;
    BootstrapSupervisor& operator=(const BootstrapSupervisor&) = delete;

    /// Start the bootstrap thread. Only the first call has an effect.
    void start();

    /// Run the bootstrap sequence on the calling thread.
    void run();

    /// Teardown hook. Safe from any thread, any number of times.
    void shutdown() noexcept;

    /// Block until the sequence reaches Ready or Failed. Returns false on timeout.
    bool waitUntilSettled(std::chrono::milliseconds timeout);

    BootstrapState state() const { return state_.load(); }
    bool isReady() const { return readiness_.isReady(); }
    std::string failureReason() const;
    std::string serverUrl() const;
    int pollAttempts() const { return poll_attempts_.load(); }
    std::optional<LaunchMethod> launchMethod() const;
    std::optional<long> serverPid() const { return process_.pid(); }

private:
    void runSequence();
    void transition(BootstrapState next);
    void becomeReady();
    void fail(const std::string& reason);
    bool sleepFor(std::chrono::milliseconds duration);
    bool stopping() const;

    SupervisorOptions options_;
    LaunchPlanInput plan_;
    HealthProbe& probe_;
    ProcessLauncher& launcher_;
    WindowHandle& window_;
    ReadinessTracker& readiness_;
    ProcessHandle& process_;

    std::atomic<BootstrapState> state_{BootstrapState::Idle};
    std::atomic<int> poll_attempts_{0};
    std::atomic<bool> started_{false};

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_{false};
    std::string failure_reason_;
    std::optional<LaunchMethod> launch_method_;

    std::mutex join_mutex_;
    std::thread thread_;
};

}  // namespace ksboot
