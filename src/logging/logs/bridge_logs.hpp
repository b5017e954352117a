#ifndef BRIDGE_LOGS_HPP
#define BRIDGE_LOGS_HPP

#include <string>

namespace MeshBridge {
namespace Logging {

class BridgeLogs {
public:
    static void log_bridge_starting();
    static void log_bridge_running();
    static void log_bridge_closing();
    static void log_bridge_closed();
    static void log_link_identity(const std::string& link_label, const std::string& node_id, const std::string& hw_model);

    static void log_message_received(const std::string& link_label, const std::string& from_id, const std::string& text);
    static void log_message_forwarded(const std::string& origin_label, const std::string& target_label, const std::string& message_id);
    static void log_duplicate_suppressed(const std::string& link_label, const std::string& message_id);
    static void log_forward_failed(const std::string& target_label, const std::string& message_id, const std::string& error_message);
    static void log_protocol_error(const std::string& link_label, const std::string& error_message);
    static void log_receive_error(const std::string& link_label, const std::string& error_message);

    static void log_injected_message(const std::string& link_label, const std::string& text);
    static void log_injected_message_failed(const std::string& link_label, const std::string& error_message);
};

} // namespace Logging
} // namespace MeshBridge

#endif // BRIDGE_LOGS_HPP
