/**
 * Health monitor thread.
 * Runs a probe cycle over both links every check interval until shutdown.
 */
#include "health_monitor_thread.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logs/health_logs.hpp"
#include <chrono>

using namespace MeshBridge::Threads;
using namespace MeshBridge::Logging;

void HealthMonitorThread::operator()() {
    set_log_thread_tag("HEALTH");
    try {
        execute_health_check_loop();
    } catch (const std::exception& exception) {
        HealthLogs::log_cycle_error(exception.what());
    } catch (...) {
        HealthLogs::log_cycle_error("Unknown exception in health thread");
    }
    clear_log_thread_tag();
}

void HealthMonitorThread::execute_health_check_loop() {
    std::chrono::seconds check_interval(health.check_interval_seconds);

    // First probe one full interval after startup; the links were just connected
    while (sleeper(check_interval)) {
        try {
            health_monitor.run_health_check_cycle();
            if (iteration_counter) {
                iteration_counter->fetch_add(1);
            }
        } catch (const std::exception& exception) {
            HealthLogs::log_cycle_error(exception.what());
        } catch (...) {
            HealthLogs::log_cycle_error("Unknown exception in health cycle");
        }
    }
}
