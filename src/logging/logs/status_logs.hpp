#ifndef STATUS_LOGS_HPP
#define STATUS_LOGS_HPP

#include <string>

namespace MeshBridge {
namespace Logging {

class StatusLogs {
public:
    static void log_status_summary(const std::string& summary_line);
    static void log_sink_failure(const std::string& sink_name, const std::string& error_message);
    static void log_reporter_error(const std::string& error_message);
    static void log_alert_sent(const std::string& alert_status, const std::string& alert_message);
    static void log_alert_logged_only(const std::string& alert_status, const std::string& alert_message);
    static void log_alert_failed(const std::string& error_message);
};

} // namespace Logging
} // namespace MeshBridge

#endif // STATUS_LOGS_HPP
