#include "link_state.hpp"

namespace MeshBridge {
namespace Bridge {

const char* link_status_to_string(LinkStatus link_status) {
    switch (link_status) {
        case LinkStatus::DISCONNECTED: return "disconnected";
        case LinkStatus::CONNECTING: return "connecting";
        case LinkStatus::CONNECTED: return "connected";
        case LinkStatus::RECOVERING: return "recovering";
    }
    return "unknown";
}

LinkStatisticsSnapshot LinkStatistics::snapshot() const {
    LinkStatisticsSnapshot statistics_snapshot;
    statistics_snapshot.received = received.load();
    statistics_snapshot.sent = sent.load();
    statistics_snapshot.errors = errors.load();
    statistics_snapshot.duplicates_suppressed = duplicates_suppressed.load();
    return statistics_snapshot;
}

LinkState::LinkState(const std::string& link_label, const std::string& port_identifier)
    : label(link_label), port(port_identifier) {}

void LinkState::set_last_error(const std::string& error_message) {
    std::lock_guard<std::mutex> detail_lock(detail_mutex);
    last_error = error_message;
}

void LinkState::clear_last_error() {
    std::lock_guard<std::mutex> detail_lock(detail_mutex);
    last_error.clear();
}

std::string LinkState::get_last_error() const {
    std::lock_guard<std::mutex> detail_lock(detail_mutex);
    return last_error;
}

void LinkState::set_port(const std::string& port_identifier) {
    std::lock_guard<std::mutex> detail_lock(detail_mutex);
    port = port_identifier;
}

std::string LinkState::get_port() const {
    std::lock_guard<std::mutex> detail_lock(detail_mutex);
    return port;
}

void LinkState::set_node_id(const std::string& node_id_value) {
    std::lock_guard<std::mutex> detail_lock(detail_mutex);
    node_id = node_id_value;
}

std::string LinkState::get_node_id() const {
    std::lock_guard<std::mutex> detail_lock(detail_mutex);
    return node_id;
}

LinkStateSnapshot LinkState::snapshot() const {
    LinkStateSnapshot state_snapshot;
    state_snapshot.label = label;
    state_snapshot.status = status.load();
    state_snapshot.consecutive_health_failures = consecutive_health_failures.load();
    {
        std::lock_guard<std::mutex> detail_lock(detail_mutex);
        state_snapshot.last_error = last_error;
        state_snapshot.port = port;
        state_snapshot.node_id = node_id;
    }
    state_snapshot.statistics = statistics.snapshot();
    return state_snapshot;
}

} // namespace Bridge
} // namespace MeshBridge
