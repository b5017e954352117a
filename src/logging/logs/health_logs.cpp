#include "health_logs.hpp"
#include "logging/logger/async_logger.hpp"

namespace MeshBridge {
namespace Logging {

void HealthLogs::log_probe_ok(const std::string& link_label) {
    log_debug_message("[" + link_label + "] Health probe ok");
}

void HealthLogs::log_probe_failed(const std::string& link_label, int consecutive_failures, int failure_threshold) {
    log_message("WARNING: [" + link_label + "] Health probe failed (" + std::to_string(consecutive_failures) +
                "/" + std::to_string(failure_threshold) + ")", "");
}

void HealthLogs::log_escalation_started(const std::string& link_label, int consecutive_failures) {
    log_message("ERROR: [" + link_label + "] Unresponsive for " + std::to_string(consecutive_failures) +
                " checks, escalating", "");
}

void HealthLogs::log_reboot_requested(const std::string& link_label, int settle_seconds) {
    log_message("[" + link_label + "] Reboot requested, waiting " + std::to_string(settle_seconds) + "s before reconnect", "");
}

void HealthLogs::log_reboot_unavailable(const std::string& link_label, const std::string& error_message) {
    log_message("WARNING: [" + link_label + "] Reboot not possible (" + error_message + "), reconnecting directly", "");
}

void HealthLogs::log_recovery_succeeded(const std::string& link_label) {
    log_message("[" + link_label + "] Recovery complete, link connected", "");
}

void HealthLogs::log_recovery_failed(const std::string& link_label, const std::string& error_message) {
    log_message("ERROR: [" + link_label + "] Recovery failed, will re-check next cycle: " + error_message, "");
}

void HealthLogs::log_escalation_aborted(const std::string& link_label) {
    log_message("[" + link_label + "] Recovery abandoned, bridge is shutting down", "");
}

void HealthLogs::log_cycle_error(const std::string& error_message) {
    log_message("ERROR: Health check cycle error: " + error_message, "");
}

void HealthLogs::log_monitor_disabled() {
    log_message("Health monitor disabled by configuration", "");
}

} // namespace Logging
} // namespace MeshBridge
