#ifndef SYSTEM_THREADS_HPP
#define SYSTEM_THREADS_HPP

#include <thread>
#include <atomic>
#include <chrono>

namespace MeshBridge {
namespace System {

/**
 * @brief Logger thread handle and per-thread iteration counters
 *
 * The logger runs outside the thread manager so it can outlive every other thread.
 */
struct SystemThreads {
    std::thread logger_thread;

    std::atomic<unsigned long> health_iterations{0};   // Completed health check cycles
    std::atomic<unsigned long> status_iterations{0};   // Published status reports
    std::atomic<unsigned long> logger_iterations{0};   // Log buffer flushes

    SystemThreads() = default;
    SystemThreads(const SystemThreads&) = delete;
    SystemThreads& operator=(const SystemThreads&) = delete;
};

} // namespace System
} // namespace MeshBridge

#endif // SYSTEM_THREADS_HPP
