#include "system_state.hpp"
#include <algorithm>

namespace MeshBridge {
namespace System {

bool SystemState::request_shutdown() {
    if (shutdown_requested.exchange(true)) {
        return false;
    }
    running.store(false);
    cv.notify_all();
    return true;
}

bool SystemState::wait_for_shutdown(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mtx);
    return cv.wait_for(lock, timeout, [this] { return shutdown_requested.load(); });
}

// The signal path notifies without holding mtx, so a wakeup can be missed;
// bounded slices keep shutdown latency at one poll interval
bool SystemState::sleep_unless_shutdown(std::chrono::milliseconds duration) {
    std::chrono::milliseconds slice(std::max(1, config.timing.main_loop_poll_interval_milliseconds));
    std::chrono::steady_clock::time_point deadline = std::chrono::steady_clock::now() + duration;

    while (!shutdown_requested.load()) {
        std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return true;
        }
        std::chrono::milliseconds remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        if (wait_for_shutdown(std::min(slice, remaining))) {
            return false;
        }
    }
    return false;
}

TimeUtils::InterruptibleSleep SystemState::make_sleeper() {
    return [this](std::chrono::milliseconds duration) { return sleep_unless_shutdown(duration); };
}

} // namespace System
} // namespace MeshBridge
