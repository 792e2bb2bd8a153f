#pragma once

#include "system/process_launcher.h"

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>

namespace ksboot {

/// Exclusive owner of the launched server process. The supervisor stores into
/// it; the shutdown hook terminates it. All access goes through one mutex.
class ProcessHandle {
public:
    explicit ProcessHandle(std::chrono::milliseconds terminate_grace = std::chrono::milliseconds(2000));
    ~ProcessHandle();

    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    /// Take ownership of a freshly launched process. Fails once terminate() has
    /// run, in which case the process is killed right away. A previously held
    /// process is terminated before being replaced.
    bool store(std::unique_ptr<ChildProcess> process);

    bool hasProcess() const;
    std::optional<long> pid() const;
    bool isRunning();
    std::optional<int> exitCode() const;

    /// Kill the owned process (bounded by the grace period) and refuse further
    /// stores. Idempotent.
    void terminate() noexcept;

    bool terminated() const;

private:
    std::chrono::milliseconds terminate_grace_;
    mutable std::mutex mutex_;
    std::unique_ptr<ChildProcess> process_;
    bool terminated_{false};
};

}  // namespace ksboot
