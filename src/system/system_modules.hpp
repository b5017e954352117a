#ifndef SYSTEM_MODULES_HPP
#define SYSTEM_MODULES_HPP

#include <memory>
#include "bridge/forwarding_engine.hpp"
#include "monitoring/health_monitor.hpp"
#include "status/alert_notifier.hpp"
#include "status/status_reporter.hpp"
#include "threads/system_threads/health_monitor_thread.hpp"
#include "threads/system_threads/status_reporter_thread.hpp"

namespace MeshBridge {
namespace System {

// Declaration order is teardown order in reverse: threads go before the engine they use
struct SystemModules {
    std::unique_ptr<Bridge::ForwardingEngine> forwarding_engine;
    std::unique_ptr<Status::AlertNotifier> alert_notifier;
    std::unique_ptr<Monitoring::HealthMonitor> health_monitor;
    std::unique_ptr<Status::StatusReporter> status_reporter;
    std::unique_ptr<Threads::HealthMonitorThread> health_thread;
    std::unique_ptr<Threads::StatusReporterThread> status_thread;
};

} // namespace System
} // namespace MeshBridge

#endif // SYSTEM_MODULES_HPP
