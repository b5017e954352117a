#ifndef SYSTEM_STATE_HPP
#define SYSTEM_STATE_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include "system/system_modules.hpp"
#include "configs/system_config.hpp"
#include "threads/thread_logic/thread_manager.hpp"
#include "logging/logger/async_logger.hpp"
#include "utils/time_utils.hpp"

namespace MeshBridge {
namespace System {

/**
 * @brief Central system state container
 *
 * Holds configuration, the shutdown signal and the lifetime of every module.
 */
struct SystemState {
    // =========================================================================
    // THREAD SYNCHRONIZATION
    // =========================================================================
    std::mutex mtx;                    // Guards the shutdown wait
    std::condition_variable cv;        // Wakes every interruptible wait on shutdown

    // =========================================================================
    // SYSTEM CONTROL FLAGS
    // =========================================================================
    std::atomic<bool> running{true};              // Main system running flag
    std::atomic<bool> shutdown_requested{false};  // Set once by request_shutdown()

    // =========================================================================
    // CONFIGURATION AND MODULES
    // =========================================================================
    Config::SystemConfig config;
    std::string config_path;
    std::shared_ptr<Logging::LoggingContext> logging_context;
    std::unique_ptr<SystemModules> bridge_modules;
    Threads::ThreadManagerState thread_manager_state;
    std::chrono::steady_clock::time_point start_time;

    explicit SystemState(const Config::SystemConfig& initial_config)
        : config(initial_config), start_time(std::chrono::steady_clock::now()) {}

    SystemState(const SystemState&) = delete;
    SystemState& operator=(const SystemState&) = delete;

    // Idempotent; returns true only for the call that initiated shutdown
    bool request_shutdown();
    bool is_shutdown_requested() const { return shutdown_requested.load(); }

    // True when shutdown was requested before the timeout
    bool wait_for_shutdown(std::chrono::milliseconds timeout);

    // Sleeps in slices of the main loop poll interval; false when cut short by shutdown
    bool sleep_unless_shutdown(std::chrono::milliseconds duration);

    TimeUtils::InterruptibleSleep make_sleeper();
};

} // namespace System
} // namespace MeshBridge

#endif // SYSTEM_STATE_HPP
