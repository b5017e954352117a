/**
 * Status reporter thread.
 * Publishes a snapshot immediately, then every report interval until shutdown.
 */
#include "status_reporter_thread.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logs/status_logs.hpp"
#include <chrono>

using namespace MeshBridge::Threads;
using namespace MeshBridge::Logging;

void StatusReporterThread::operator()() {
    set_log_thread_tag("STATUS");
    std::chrono::seconds report_interval(status.report_interval_seconds);

    do {
        try {
            status_reporter.publish(true);
            if (iteration_counter) {
                iteration_counter->fetch_add(1);
            }
        } catch (const std::exception& exception) {
            StatusLogs::log_reporter_error(exception.what());
        } catch (...) {
            StatusLogs::log_reporter_error("Unknown exception");
        }
    } while (sleeper(report_interval));

    clear_log_thread_tag();
}
