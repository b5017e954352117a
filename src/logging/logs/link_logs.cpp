#include "link_logs.hpp"
#include "logging/logger/async_logger.hpp"
#include <iomanip>
#include <sstream>

namespace MeshBridge {
namespace Logging {

void LinkLogs::log_connect_attempt(const std::string& link_label, const std::string& port, int attempt, int max_attempts) {
    log_message("[" + link_label + "] Connecting on " + port + " (attempt " + std::to_string(attempt) +
                "/" + std::to_string(max_attempts) + ")", "");
}

void LinkLogs::log_connect_success(const std::string& link_label, const std::string& port, const std::string& node_id) {
    log_message("[" + link_label + "] Connected on " + port + " node=" + (node_id.empty() ? "unknown" : node_id), "");
}

void LinkLogs::log_connect_attempt_failed(const std::string& link_label, int attempt, int max_attempts, const std::string& error_message) {
    log_message("WARNING: [" + link_label + "] Connect attempt " + std::to_string(attempt) + "/" +
                std::to_string(max_attempts) + " failed: " + error_message, "");
}

void LinkLogs::log_retry_scheduled(const std::string& link_label, double delay_seconds) {
    std::ostringstream delay_stream;
    delay_stream << std::fixed << std::setprecision(1) << delay_seconds;
    log_message("[" + link_label + "] Retrying in " + delay_stream.str() + "s", "");
}

void LinkLogs::log_connect_exhausted(const std::string& link_label, const std::string& port, int max_attempts) {
    log_message("ERROR: [" + link_label + "] Could not connect on " + port + " after " +
                std::to_string(max_attempts) + " attempts", "");
}

void LinkLogs::log_connect_interrupted(const std::string& link_label) {
    log_message("[" + link_label + "] Connect abandoned, shutdown in progress", "");
}

void LinkLogs::log_recovering(const std::string& link_label, const std::string& reason) {
    log_message("WARNING: [" + link_label + "] Recovering link: " + reason, "");
}

void LinkLogs::log_reconnect_exhausted(const std::string& link_label, const std::string& error_message) {
    log_message("ERROR: [" + link_label + "] Reconnect exhausted, link left disconnected: " + error_message, "");
}

void LinkLogs::log_connection_lost(const std::string& link_label, const std::string& reason) {
    log_message("ERROR: [" + link_label + "] Connection lost: " + reason, "");
}

void LinkLogs::log_disconnected(const std::string& link_label) {
    log_message("[" + link_label + "] Disconnected", "");
}

void LinkLogs::log_close_error(const std::string& link_label, const std::string& error_message) {
    log_message("ERROR: [" + link_label + "] Error closing link: " + error_message, "");
}

void LinkLogs::log_identity_missing(const std::string& link_label) {
    log_message("WARNING: [" + link_label + "] Radio did not report a node id; check that the serial API is enabled", "");
}

void LinkLogs::log_serial_opened(const std::string& port, int baud_rate) {
    log_debug_message("Serial port " + port + " opened at " + std::to_string(baud_rate) + " baud");
}

void LinkLogs::log_serial_protocol_error(const std::string& port, const std::string& error_message) {
    log_message("WARNING: Dropped malformed line from " + port + ": " + error_message, "");
}

void LinkLogs::log_serial_read_error(const std::string& port, const std::string& error_message) {
    log_message("ERROR: Serial read error on " + port + ": " + error_message, "");
}

void LinkLogs::log_serial_identity_timeout(const std::string& port) {
    log_message("WARNING: No node identity from " + port + " within timeout", "");
}

void LinkLogs::log_serial_reader_exception(const std::string& port, const std::string& error_message) {
    log_message("ERROR: Serial reader on " + port + " exception: " + error_message, "");
}

} // namespace Logging
} // namespace MeshBridge
