#include "config_loader.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cstdlib>
#include <stdexcept>

namespace MeshBridge {
namespace Config {

namespace {
    inline std::string trim(const std::string& s) {
        const char* ws = " \t\r\n";
        auto b = s.find_first_not_of(ws);
        auto e = s.find_last_not_of(ws);
        if (b == std::string::npos) return "";
        return s.substr(b, e - b + 1);
    }

    inline bool to_bool(const std::string& v) {
        std::string s = v; std::transform(s.begin(), s.end(), s.begin(), ::tolower);
        return s == "1" || s == "true" || s == "yes";
    }

    bool apply_config_value(SystemConfig& cfg, const std::string& key, const std::string& value) {
        // Links
        if (key == "links.link_a_port") cfg.links.link_a_port = value;
        else if (key == "links.link_b_port") cfg.links.link_b_port = value;
        else if (key == "links.link_a_label") cfg.links.link_a_label = value;
        else if (key == "links.link_b_label") cfg.links.link_b_label = value;
        else if (key == "links.auto_detect") cfg.links.auto_detect = to_bool(value);
        else if (key == "links.baud_rate") cfg.links.baud_rate = std::stoi(value);
        else if (key == "links.open_settle_ms") cfg.links.open_settle_milliseconds = std::stoi(value);
        else if (key == "links.probe_timeout_ms") cfg.links.probe_timeout_milliseconds = std::stoi(value);
        else if (key == "links.identity_timeout_ms") cfg.links.identity_timeout_milliseconds = std::stoi(value);

        // Tracker
        else if (key == "tracker.max_age_seconds") cfg.tracker.max_age_seconds = std::stoi(value);
        else if (key == "tracker.max_messages") cfg.tracker.max_messages = std::stoi(value);
        else if (key == "tracker.recent_messages_count") cfg.tracker.recent_messages_count = std::stoi(value);

        // Connection
        else if (key == "connection.max_attempts") cfg.connection.max_attempts = std::stoi(value);
        else if (key == "connection.initial_retry_delay_seconds") cfg.connection.initial_retry_delay_seconds = std::stoi(value);
        else if (key == "connection.backoff_multiplier") cfg.connection.backoff_multiplier = std::stod(value);

        // Health
        else if (key == "health.enabled") cfg.health.enabled = to_bool(value);
        else if (key == "health.check_interval_seconds") cfg.health.check_interval_seconds = std::stoi(value);
        else if (key == "health.failure_threshold") cfg.health.failure_threshold = std::stoi(value);
        else if (key == "health.reboot_settle_seconds") cfg.health.reboot_settle_seconds = std::stoi(value);

        // Status
        else if (key == "status.report_interval_seconds") cfg.status.report_interval_seconds = std::stoi(value);
        else if (key == "status.file_path") cfg.status.file_path = value;
        else if (key == "status.webhook_url") cfg.status.webhook_url = value;
        else if (key == "status.webhook_timeout_seconds") cfg.status.webhook_timeout_seconds = std::stoi(value);
        else if (key == "status.log_summary") cfg.status.log_summary = to_bool(value);

        // Alerts
        else if (key == "alerts.webhook_url") cfg.alerts.webhook_url = value;
        else if (key == "alerts.timeout_seconds") cfg.alerts.timeout_seconds = std::stoi(value);
        else if (key == "alerts.service_name") cfg.alerts.service_name = value;

        // Discovery
        else if (key == "discovery.wait_for_devices_seconds") cfg.discovery.wait_for_devices_seconds = std::stoi(value);
        else if (key == "discovery.check_interval_seconds") cfg.discovery.check_interval_seconds = std::stoi(value);
        else if (key == "discovery.verify_radios") cfg.discovery.verify_radios = to_bool(value);

        // Logging
        else if (key == "logging.log_directory") cfg.logging.log_directory = value;
        else if (key == "logging.log_file") cfg.logging.log_file = value;
        else if (key == "logging.debug_enabled") cfg.logging.debug_enabled = to_bool(value);

        // Timing
        else if (key == "timing.logging_poll_ms") cfg.timing.logging_poll_interval_milliseconds = std::stoi(value);
        else if (key == "timing.main_loop_poll_ms") cfg.timing.main_loop_poll_interval_milliseconds = std::stoi(value);
        else if (key == "timing.shutdown_join_warning_seconds") cfg.timing.shutdown_join_warning_seconds = std::stoi(value);

        else return false;
        return true;
    }
}

bool load_config_from_csv(SystemConfig& cfg, const std::string& csv_path, std::string& error_message) {
    std::ifstream in(csv_path);
    if (!in.is_open()) {
        error_message = "Cannot open config file " + csv_path;
        return false;
    }
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        std::stringstream ss(line);
        std::string key, value;
        if (!std::getline(ss, key, ',')) continue;
        if (!std::getline(ss, value)) value.clear();
        key = trim(key); value = trim(value);

        try {
            apply_config_value(cfg, key, value);
        } catch (const std::exception& parse_exception) {
            error_message = "Invalid value '" + value + "' for " + key;
            return false;
        }
    }
    return true;
}

bool validate_config(const SystemConfig& config, std::string& error_message) {
    if (config.links.link_a_label.empty() || config.links.link_b_label.empty()) {
        error_message = "links.link_a_label and links.link_b_label must be set";
        return false;
    }
    if (config.links.link_a_label == config.links.link_b_label) {
        error_message = "links.link_a_label and links.link_b_label must differ";
        return false;
    }
    if (!config.links.link_a_port.empty() && config.links.link_a_port == config.links.link_b_port) {
        error_message = "links.link_a_port and links.link_b_port must differ";
        return false;
    }
    if (config.links.baud_rate <= 0) {
        error_message = "links.baud_rate must be > 0";
        return false;
    }
    if (config.tracker.max_age_seconds <= 0 || config.tracker.max_messages <= 0) {
        error_message = "tracker.max_age_seconds and tracker.max_messages must be > 0";
        return false;
    }
    if (config.connection.max_attempts < 1) {
        error_message = "connection.max_attempts must be >= 1";
        return false;
    }
    if (config.connection.initial_retry_delay_seconds < 0) {
        error_message = "connection.initial_retry_delay_seconds must be >= 0";
        return false;
    }
    if (config.connection.backoff_multiplier < 1.0) {
        error_message = "connection.backoff_multiplier must be >= 1.0";
        return false;
    }
    if (config.health.check_interval_seconds <= 0) {
        error_message = "health.check_interval_seconds must be > 0";
        return false;
    }
    if (config.health.failure_threshold < 1) {
        error_message = "health.failure_threshold must be >= 1";
        return false;
    }
    if (config.status.report_interval_seconds <= 0) {
        error_message = "status.report_interval_seconds must be > 0";
        return false;
    }
    if (config.logging.log_file.empty()) {
        error_message = "logging.log_file is empty";
        return false;
    }
    if (config.timing.logging_poll_interval_milliseconds <= 0 || config.timing.main_loop_poll_interval_milliseconds <= 0) {
        error_message = "timing poll intervals must be > 0";
        return false;
    }
    return true;
}

std::string resolve_config_path(const std::string& explicit_path) {
    if (!explicit_path.empty()) {
        return explicit_path;
    }
    const char* environment_path = std::getenv(CONFIG_PATH_ENV_VARIABLE);
    if (environment_path && *environment_path) {
        return std::string(environment_path);
    }
    return DEFAULT_CONFIG_PATH;
}

int load_system_config(SystemConfig& config, const std::string& explicit_path, std::string& error_message) {
    std::string config_path = resolve_config_path(explicit_path);
    bool path_was_requested = config_path != DEFAULT_CONFIG_PATH;

    std::ifstream probe_stream(config_path);
    bool file_exists = probe_stream.good();
    probe_stream.close();

    if (file_exists) {
        if (!load_config_from_csv(config, config_path, error_message)) {
            return 1;
        }
    } else if (path_was_requested) {
        error_message = "Config file not found: " + config_path;
        return 1;
    }

    if (!validate_config(config, error_message)) {
        return 1;
    }
    return 0;
}

} // namespace Config
} // namespace MeshBridge
