#ifndef HEALTH_MONITOR_THREAD_HPP
#define HEALTH_MONITOR_THREAD_HPP

#include "configs/health_config.hpp"
#include "monitoring/health_monitor.hpp"
#include "utils/time_utils.hpp"
#include <atomic>

namespace MeshBridge {
namespace Threads {

struct HealthMonitorThread {
    const Config::HealthConfig& health;
    Monitoring::HealthMonitor& health_monitor;
    TimeUtils::InterruptibleSleep sleeper;
    std::atomic<unsigned long>* iteration_counter {nullptr};

    HealthMonitorThread(const Config::HealthConfig& health_cfg,
                        Monitoring::HealthMonitor& monitor_ref,
                        TimeUtils::InterruptibleSleep sleep_function)
        : health(health_cfg), health_monitor(monitor_ref), sleeper(std::move(sleep_function)) {}

    void set_iteration_counter(std::atomic<unsigned long>& counter) { iteration_counter = &counter; }
    void operator()();

private:
    void execute_health_check_loop();
};

} // namespace Threads
} // namespace MeshBridge

#endif // HEALTH_MONITOR_THREAD_HPP
