#ifndef ALERT_NOTIFIER_HPP
#define ALERT_NOTIFIER_HPP

#include "configs/status_config.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace MeshBridge {
namespace Status {

constexpr const char* ALERT_STATUS_FAILED = "failed";
constexpr const char* ALERT_STATUS_DEGRADED = "degraded";

/**
 * Posts failure alerts to the configured webhook. Without a webhook the alert
 * is only logged. Never throws.
 */
class AlertNotifier {
public:
    explicit AlertNotifier(const Config::AlertConfig& alert_config) : config(alert_config) {}

    // True when the alert reached the webhook
    bool send_alert(const std::string& alert_status, const std::string& alert_message);

    nlohmann::json build_alert_payload(const std::string& alert_status, const std::string& alert_message) const;

private:
    const Config::AlertConfig& config;
};

std::string get_host_name();

} // namespace Status
} // namespace MeshBridge

#endif // ALERT_NOTIFIER_HPP
