#ifndef STATUS_SNAPSHOT_HPP
#define STATUS_SNAPSHOT_HPP

#include "bridge/link_state.hpp"
#include "bridge/message_tracker.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace MeshBridge {
namespace Bridge {
class ForwardingEngine;
}

namespace Status {

// Point-in-time copy of engine state; safe to hand to any thread
struct StatusSnapshot {
    bool running = false;
    bool links_connected = false;
    double uptime_seconds = 0.0;
    double timestamp = 0.0;                          // Epoch seconds
    std::vector<Bridge::LinkStateSnapshot> links;    // Link A first
    Bridge::TrackerStatistics tracker;
    std::size_t recent_message_count = 0;
    uint64_t duplicates_suppressed = 0;

    nlohmann::json to_json() const;
    std::string to_summary_line() const;
};

StatusSnapshot build_status_snapshot(Bridge::ForwardingEngine& engine, bool running);

} // namespace Status
} // namespace MeshBridge

#endif // STATUS_SNAPSHOT_HPP
