#ifndef LINK_LOGS_HPP
#define LINK_LOGS_HPP

#include <string>

namespace MeshBridge {
namespace Logging {

/**
 * Connection lifecycle and serial transport events, one line per state transition.
 */
class LinkLogs {
public:
    // Connection manager
    static void log_connect_attempt(const std::string& link_label, const std::string& port, int attempt, int max_attempts);
    static void log_connect_success(const std::string& link_label, const std::string& port, const std::string& node_id);
    static void log_connect_attempt_failed(const std::string& link_label, int attempt, int max_attempts, const std::string& error_message);
    static void log_retry_scheduled(const std::string& link_label, double delay_seconds);
    static void log_connect_exhausted(const std::string& link_label, const std::string& port, int max_attempts);
    static void log_connect_interrupted(const std::string& link_label);
    static void log_recovering(const std::string& link_label, const std::string& reason);
    static void log_reconnect_exhausted(const std::string& link_label, const std::string& error_message);
    static void log_connection_lost(const std::string& link_label, const std::string& reason);
    static void log_disconnected(const std::string& link_label);
    static void log_close_error(const std::string& link_label, const std::string& error_message);
    static void log_identity_missing(const std::string& link_label);

    // Serial transport
    static void log_serial_opened(const std::string& port, int baud_rate);
    static void log_serial_protocol_error(const std::string& port, const std::string& error_message);
    static void log_serial_read_error(const std::string& port, const std::string& error_message);
    static void log_serial_identity_timeout(const std::string& port);
    static void log_serial_reader_exception(const std::string& port, const std::string& error_message);
};

} // namespace Logging
} // namespace MeshBridge

#endif // LINK_LOGS_HPP
