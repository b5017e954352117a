#ifndef THREAD_MANAGER_HPP
#define THREAD_MANAGER_HPP

#include "logging/logger/async_logger.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace MeshBridge {
namespace Threads {

// Generic thread definition for thread management
struct ThreadDefinition {
    std::string name;
    std::function<void()> thread_function;

    ThreadDefinition(const std::string& n, std::function<void()> func)
        : name(n), thread_function(std::move(func)) {}
};

struct ThreadManagerState {
    std::vector<std::thread> active_threads;
    std::vector<std::string> thread_names;
    std::vector<std::shared_ptr<std::atomic<bool>>> finished_flags;

    void clear_all_data() {
        active_threads.clear();
        thread_names.clear();
        finished_flags.clear();
    }
};

class Manager {
public:
    // Each thread runs with the given logging context installed thread-locally
    static bool start_threads(ThreadManagerState& manager_state, const std::vector<ThreadDefinition>& thread_definitions,
                              MeshBridge::Logging::LoggingContext& logging_context);

    // Joins every thread. Threads still running after slow_join_warning are logged and
    // waited for; returns false when any of them was that slow.
    static bool shutdown_threads(ThreadManagerState& manager_state, std::chrono::milliseconds slow_join_warning);
};

} // namespace Threads
} // namespace MeshBridge

#endif // THREAD_MANAGER_HPP
