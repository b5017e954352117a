#include "alert_notifier.hpp"
#include "logging/logs/status_logs.hpp"
#include "utils/http_utils.hpp"
#include "utils/time_utils.hpp"
#include <unistd.h>

using MeshBridge::Logging::StatusLogs;

namespace MeshBridge {
namespace Status {

std::string get_host_name() {
    char host_name_buffer[256] = {0};
    if (gethostname(host_name_buffer, sizeof(host_name_buffer) - 1) != 0) {
        return "unknown";
    }
    return std::string(host_name_buffer);
}

nlohmann::json AlertNotifier::build_alert_payload(const std::string& alert_status, const std::string& alert_message) const {
    return nlohmann::json{
        {"service", config.service_name},
        {"host", get_host_name()},
        {"timestamp", TimeUtils::get_current_iso_time_with_z()},
        {"status", alert_status},
        {"message", alert_message}
    };
}

bool AlertNotifier::send_alert(const std::string& alert_status, const std::string& alert_message) {
    if (config.webhook_url.empty()) {
        StatusLogs::log_alert_logged_only(alert_status, alert_message);
        return false;
    }
    try {
        HttpUtils::HttpRequest alert_request(config.webhook_url, build_alert_payload(alert_status, alert_message).dump(),
                                             config.timeout_seconds);
        HttpUtils::http_post(alert_request);
        StatusLogs::log_alert_sent(alert_status, alert_message);
        return true;
    } catch (const std::exception& alert_exception_error) {
        StatusLogs::log_alert_failed(alert_exception_error.what());
        return false;
    }
}

} // namespace Status
} // namespace MeshBridge
