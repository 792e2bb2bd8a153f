#include "runtime/state.h"

namespace ksboot {

std::atomic<bool> g_running_flag{true};

bool ReadinessTracker::markReady() {
    bool expected = false;
    return ready_.compare_exchange_strong(expected, true, std::memory_order_acq_rel);
}

}  // namespace ksboot
