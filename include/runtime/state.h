#pragma once

#include <atomic>

namespace ksboot {

extern std::atomic<bool> g_running_flag;

inline bool is_running() { return g_running_flag.load(); }
inline void request_shutdown() { g_running_flag.store(false); }

/// Write-once readiness flag shared between the supervisor thread and UI queries.
/// Once set it stays set for the lifetime of the process.
class ReadinessTracker {
public:
    ReadinessTracker() = default;
    ReadinessTracker(const ReadinessTracker&) = delete;
    ReadinessTracker& operator=(const ReadinessTracker&) = delete;

    /// Returns true only for the call that flipped the flag.
    bool markReady();

    bool isReady() const { return ready_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> ready_{false};
};

}  // namespace ksboot
