#include "bridge_logs.hpp"
#include "logging/logger/async_logger.hpp"

namespace MeshBridge {
namespace Logging {

namespace {
    constexpr std::size_t TEXT_PREVIEW_LENGTH = 80;

    std::string preview_text(const std::string& text) {
        if (text.size() <= TEXT_PREVIEW_LENGTH) {
            return text;
        }
        return text.substr(0, TEXT_PREVIEW_LENGTH) + "...";
    }
}

void BridgeLogs::log_bridge_starting() {
    log_message("Starting bridge, connecting both links", "");
}

void BridgeLogs::log_bridge_running() {
    log_message("Bridge is now running", "");
}

void BridgeLogs::log_bridge_closing() {
    log_message("Closing bridge connections...", "");
}

void BridgeLogs::log_bridge_closed() {
    log_message("Bridge closed", "");
}

void BridgeLogs::log_link_identity(const std::string& link_label, const std::string& node_id, const std::string& hw_model) {
    log_message("[" + link_label + "] node=" + node_id + (hw_model.empty() ? std::string("") : " hw=" + hw_model), "");
}

void BridgeLogs::log_message_received(const std::string& link_label, const std::string& from_id, const std::string& text) {
    log_message("[" + link_label + "] Received from " + from_id + ": " + preview_text(text), "");
}

void BridgeLogs::log_message_forwarded(const std::string& origin_label, const std::string& target_label, const std::string& message_id) {
    log_message("[" + origin_label + " -> " + target_label + "] Forwarded message " + message_id, "");
}

void BridgeLogs::log_duplicate_suppressed(const std::string& link_label, const std::string& message_id) {
    log_debug_message("[" + link_label + "] Already seen message " + message_id + ", skipping");
}

void BridgeLogs::log_forward_failed(const std::string& target_label, const std::string& message_id, const std::string& error_message) {
    log_message("ERROR: Failed to forward message " + message_id + " to " + target_label + ": " + error_message, "");
}

void BridgeLogs::log_protocol_error(const std::string& link_label, const std::string& error_message) {
    log_message("WARNING: [" + link_label + "] Dropped malformed packet: " + error_message, "");
}

void BridgeLogs::log_receive_error(const std::string& link_label, const std::string& error_message) {
    log_message("ERROR: [" + link_label + "] Error handling message: " + error_message, "");
}

void BridgeLogs::log_injected_message(const std::string& link_label, const std::string& text) {
    log_message("Sent message via " + link_label + ": " + preview_text(text), "");
}

void BridgeLogs::log_injected_message_failed(const std::string& link_label, const std::string& error_message) {
    log_message("ERROR: Failed to send message via " + link_label + ": " + error_message, "");
}

} // namespace Logging
} // namespace MeshBridge
