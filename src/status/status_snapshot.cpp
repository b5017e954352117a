#include "status_snapshot.hpp"
#include "bridge/forwarding_engine.hpp"
#include "utils/time_utils.hpp"
#include <sstream>

using json = nlohmann::json;

namespace MeshBridge {
namespace Status {

json StatusSnapshot::to_json() const {
    json stats_json = json::object();
    json health_failures_json = json::object();
    json ports_json = json::object();
    json link_states_json = json::object();

    for (const Bridge::LinkStateSnapshot& link : links) {
        stats_json[link.label] = {
            {"received", link.statistics.received},
            {"sent", link.statistics.sent},
            {"errors", link.statistics.errors},
            {"duplicates_suppressed", link.statistics.duplicates_suppressed}
        };
        health_failures_json[link.label] = link.consecutive_health_failures;
        ports_json[link.label] = link.port;
        link_states_json[link.label] = {
            {"status", Bridge::link_status_to_string(link.status)},
            {"last_error", link.last_error},
            {"port", link.port},
            {"node_id", link.node_id}
        };
    }
    stats_json["tracker"] = {
        {"total_seen", tracker.total_seen},
        {"total_forwarded", tracker.total_forwarded},
        {"currently_tracked", tracker.currently_tracked}
    };

    return json{
        {"running", running},
        {"links_connected", links_connected},
        {"radios_connected", links_connected},
        {"uptime_seconds", uptime_seconds},
        {"timestamp", timestamp},
        {"stats", stats_json},
        {"health_failures", health_failures_json},
        {"ports", ports_json},
        {"link_states", link_states_json},
        {"recent_message_count", recent_message_count},
        {"duplicates_suppressed", duplicates_suppressed}
    };
}

std::string StatusSnapshot::to_summary_line() const {
    std::ostringstream summary_stream;
    summary_stream << (running ? "running" : "stopped")
                   << " up " << TimeUtils::format_duration_seconds(static_cast<long long>(uptime_seconds));
    for (const Bridge::LinkStateSnapshot& link : links) {
        summary_stream << " | " << link.label << " " << Bridge::link_status_to_string(link.status)
                       << " rx=" << link.statistics.received
                       << " tx=" << link.statistics.sent
                       << " err=" << link.statistics.errors
                       << " hf=" << link.consecutive_health_failures;
    }
    summary_stream << " | tracked=" << tracker.currently_tracked
                   << " forwarded=" << tracker.total_forwarded
                   << " dup=" << duplicates_suppressed;
    return summary_stream.str();
}

StatusSnapshot build_status_snapshot(Bridge::ForwardingEngine& engine, bool running) {
    StatusSnapshot snapshot;
    snapshot.running = running;
    snapshot.links_connected = engine.all_links_connected();
    snapshot.uptime_seconds = engine.get_uptime_seconds();
    snapshot.timestamp = TimeUtils::get_current_epoch_seconds();
    snapshot.links.push_back(engine.get_link_state(Link::LinkId::LINK_A).snapshot());
    snapshot.links.push_back(engine.get_link_state(Link::LinkId::LINK_B).snapshot());
    snapshot.tracker = engine.get_tracker().get_stats();
    snapshot.recent_message_count = engine.get_recent_messages().size();
    for (const Bridge::LinkStateSnapshot& link : snapshot.links) {
        snapshot.duplicates_suppressed += link.statistics.duplicates_suppressed;
    }
    return snapshot;
}

} // namespace Status
} // namespace MeshBridge
