#include "startup_logs.hpp"
#include "logging/logging_macros.hpp"

namespace MeshBridge {
namespace Logging {

void StartupLogs::log_application_header(const std::string& config_path) {
    log_message("================================================================================", "");
    log_message("                         MESH BRIDGE - RADIO TO RADIO RELAY", "");
    log_message("================================================================================", "");
    log_message("Configuration: " + config_path, "");
}

void StartupLogs::log_configuration_summary(const Config::SystemConfig& config) {
    LOG_STARTUP_SECTION_HEADER("CONFIGURATION");
    LOG_STARTUP_CONTENT("Links: " + config.links.link_a_label + " <-> " + config.links.link_b_label +
                        " @ " + std::to_string(config.links.baud_rate) + " baud");
    LOG_STARTUP_CONTENT("Dedup window: " + std::to_string(config.tracker.max_age_seconds) + "s, " +
                        std::to_string(config.tracker.max_messages) + " messages");
    LOG_STARTUP_CONTENT("Connect: " + std::to_string(config.connection.max_attempts) + " attempts, first retry after " +
                        std::to_string(config.connection.initial_retry_delay_seconds) + "s");
    if (config.health.enabled) {
        LOG_STARTUP_CONTENT("Health: every " + std::to_string(config.health.check_interval_seconds) +
                            "s, escalate after " + std::to_string(config.health.failure_threshold) + " failures");
    } else {
        LOG_STARTUP_CONTENT("Health: disabled");
    }
    LOG_STARTUP_CONTENT("Status: every " + std::to_string(config.status.report_interval_seconds) + "s" +
                        (config.status.file_path.empty() ? std::string("") : " -> " + config.status.file_path));
    LOG_STARTUP_CONTENT(std::string("Alerts: ") + (config.alerts.webhook_url.empty() ? "log only" : "webhook"));
    LOG_STARTUP_SECTION_FOOTER();
}

void StartupLogs::log_device_wait(int found_count, int required_count, int waited_seconds) {
    log_message("Waiting for radios: " + std::to_string(found_count) + "/" + std::to_string(required_count) +
                " found after " + std::to_string(waited_seconds) + "s", "");
}

void StartupLogs::log_devices_found(const std::vector<std::string>& device_paths) {
    LOG_STARTUP_SECTION_HEADER("SERIAL DEVICES");
    for (const std::string& device_path : device_paths) {
        LOG_STARTUP_CONTENT(device_path);
    }
    LOG_STARTUP_SECTION_FOOTER();
}

void StartupLogs::log_port_assignment(const std::string& link_label, const std::string& port, bool auto_detected) {
    log_message(link_label + " -> " + port + (auto_detected ? " (auto-detected)" : ""), "");
}

void StartupLogs::log_port_verified(const std::string& port, const std::string& node_id) {
    log_message("Radio " + node_id + " answered on " + port, "");
}

void StartupLogs::log_port_rejected(const std::string& port, const std::string& reason) {
    log_message("WARNING: Skipping " + port + ", not a mesh radio: " + reason, "");
}

} // namespace Logging
} // namespace MeshBridge
