#include "status_logs.hpp"
#include "logging/logger/async_logger.hpp"

namespace MeshBridge {
namespace Logging {

void StatusLogs::log_status_summary(const std::string& summary_line) {
    log_message("STATUS: " + summary_line, "");
}

void StatusLogs::log_sink_failure(const std::string& sink_name, const std::string& error_message) {
    log_message("WARNING: Status sink " + sink_name + " failed: " + error_message, "");
}

void StatusLogs::log_reporter_error(const std::string& error_message) {
    log_message("ERROR: Status reporter error: " + error_message, "");
}

void StatusLogs::log_alert_sent(const std::string& alert_status, const std::string& alert_message) {
    log_message("ALERT (" + alert_status + ") sent: " + alert_message, "");
}

void StatusLogs::log_alert_logged_only(const std::string& alert_status, const std::string& alert_message) {
    log_message("ALERT (" + alert_status + "): " + alert_message, "");
}

void StatusLogs::log_alert_failed(const std::string& error_message) {
    log_message("ERROR: Failed to deliver alert: " + error_message, "");
}

} // namespace Logging
} // namespace MeshBridge
