#include "core/process_handle.h"

#include <spdlog/spdlog.h>

namespace ksboot {

ProcessHandle::ProcessHandle(std::chrono::milliseconds terminate_grace)
    : terminate_grace_(terminate_grace) {}

ProcessHandle::~ProcessHandle() { terminate(); }

bool ProcessHandle::store(std::unique_ptr<ChildProcess> process) {
    if (!process) return false;

    std::lock_guard<std::mutex> lock(mutex_);
    if (terminated_) {
        spdlog::warn("Shutdown already requested, stopping late server process {}", process->pid());
        process->terminate(terminate_grace_);
        return false;
    }
    if (process_) {
        spdlog::warn("Replacing server process {} with {}", process_->pid(), process->pid());
        process_->terminate(terminate_grace_);
    }
    process_ = std::move(process);
    return true;
}

bool ProcessHandle::hasProcess() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return process_ != nullptr;
}

std::optional<long> ProcessHandle::pid() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!process_) return std::nullopt;
    return process_->pid();
}

bool ProcessHandle::isRunning() {
    std::lock_guard<std::mutex> lock(mutex_);
    return process_ && process_->isRunning();
}

std::optional<int> ProcessHandle::exitCode() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!process_) return std::nullopt;
    return process_->exitCode();
}

void ProcessHandle::terminate() noexcept {
    std::unique_ptr<ChildProcess> victim;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        terminated_ = true;
        victim = std::move(process_);
    }
    if (!victim) return;

    spdlog::info("Stopping server process {}", victim->pid());
    victim->terminate(terminate_grace_);
    if (auto code = victim->exitCode()) {
        spdlog::debug("Server process {} exited with {}", victim->pid(), *code);
    }
}

bool ProcessHandle::terminated() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return terminated_;
}

}  // namespace ksboot
