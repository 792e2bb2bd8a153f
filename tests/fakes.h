#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/health_probe.h"
#include "runtime/state.h"
#include "system/process_launcher.h"
#include "ui/window_handle.h"

namespace ksboot::testing {

// Observable state of a FakeChildProcess, kept alive after the process object
// has been handed over and destroyed.
struct FakeProcessState {
    std::atomic<bool> running{true};
    std::atomic<int> terminate_calls{0};
    std::atomic<int> exit_status{-1};  // -1 while running
};

class FakeChildProcess : public ChildProcess {
public:
    FakeChildProcess(long pid, std::shared_ptr<FakeProcessState> state)
        : pid_(pid), state_(std::move(state)) {}

    long pid() const override { return pid_; }
    bool isRunning() override { return state_->running.load(); }
    std::optional<int> exitCode() const override {
        int status = state_->exit_status.load();
        if (status < 0) return std::nullopt;
        return status;
    }
    void terminate(std::chrono::milliseconds) noexcept override {
        state_->terminate_calls.fetch_add(1);
        if (state_->running.exchange(false)) {
            state_->exit_status.store(143);
        }
    }

private:
    long pid_;
    std::shared_ptr<FakeProcessState> state_;
};

// Records every launch request and refuses programs listed in `failing`.
class FakeLauncher : public ProcessLauncher {
public:
    LaunchResult launch(const LaunchSpec& spec) override {
        std::lock_guard<std::mutex> lock(mutex_);
        specs.push_back(spec);
        LaunchResult result;
        for (const auto& program : failing) {
            if (program == spec.program) {
                result.error = spec.program + ": not found or not executable";
                return result;
            }
        }
        auto state = std::make_shared<FakeProcessState>();
        states.push_back(state);
        result.process = std::make_unique<FakeChildProcess>(next_pid_++, state);
        return result;
    }

    size_t launchCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return specs.size();
    }

    std::vector<std::string> failing;
    std::vector<LaunchSpec> specs;
    std::vector<std::shared_ptr<FakeProcessState>> states;

private:
    mutable std::mutex mutex_;
    long next_pid_{4242};
};

// Fails until the `succeed_on`-th call (1-based); 0 means never succeed.
class FakeHealthProbe : public HealthProbe {
public:
    explicit FakeHealthProbe(int succeed_on = 0) : succeed_on_(succeed_on) {}

    bool probe(const std::string&, uint16_t, std::chrono::milliseconds) override {
        int n = ++calls_;
        return succeed_on_ > 0 && n >= succeed_on_;
    }

    int calls() const { return calls_.load(); }

private:
    int succeed_on_;
    std::atomic<int> calls_{0};
};

// When `readiness` is set, navigate() also records whether readiness had
// already been marked at the moment of the redirect.
class RecordingWindow : public WindowHandle {
public:
    void navigate(const std::string& url) override {
        std::lock_guard<std::mutex> lock(mutex_);
        navigations.push_back(url);
        if (readiness) {
            ready_at_navigate.push_back(readiness->isReady());
        }
    }
    void showFailure(const std::string& reason) override {
        std::lock_guard<std::mutex> lock(mutex_);
        failures.push_back(reason);
    }

    size_t navigationCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return navigations.size();
    }
    size_t failureCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return failures.size();
    }

    const ReadinessTracker* readiness{nullptr};
    std::vector<std::string> navigations;
    std::vector<bool> ready_at_navigate;
    std::vector<std::string> failures;

private:
    mutable std::mutex mutex_;
};

}  // namespace ksboot::testing
