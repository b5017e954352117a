#ifndef HEALTH_LOGS_HPP
#define HEALTH_LOGS_HPP

#include <string>

namespace MeshBridge {
namespace Logging {

class HealthLogs {
public:
    static void log_probe_ok(const std::string& link_label);
    static void log_probe_failed(const std::string& link_label, int consecutive_failures, int failure_threshold);
    static void log_escalation_started(const std::string& link_label, int consecutive_failures);
    static void log_reboot_requested(const std::string& link_label, int settle_seconds);
    static void log_reboot_unavailable(const std::string& link_label, const std::string& error_message);
    static void log_recovery_succeeded(const std::string& link_label);
    static void log_recovery_failed(const std::string& link_label, const std::string& error_message);
    static void log_escalation_aborted(const std::string& link_label);
    static void log_cycle_error(const std::string& error_message);
    static void log_monitor_disabled();
};

} // namespace Logging
} // namespace MeshBridge

#endif // HEALTH_LOGS_HPP
