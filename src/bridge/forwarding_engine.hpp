#ifndef FORWARDING_ENGINE_HPP
#define FORWARDING_ENGINE_HPP

#include "connection_manager.hpp"
#include "link_state.hpp"
#include "message_tracker.hpp"
#include "configs/system_config.hpp"
#include "link/radio_link_interface.hpp"
#include "utils/time_utils.hpp"
#include <array>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace MeshBridge {
namespace Bridge {

struct EngineStatistics {
    LinkStatisticsSnapshot link_a;
    LinkStatisticsSnapshot link_b;
    TrackerStatistics tracker;

    uint64_t duplicates_suppressed() const { return link_a.duplicates_suppressed + link_b.duplicates_suppressed; }
};

/**
 * Relays text messages between link A and link B.
 *
 * Inbound packets from either link are deduplicated through the tracker and
 * sent unchanged to the other link. A failed forward is counted against the
 * target link and dropped; the engine never retries or queues.
 */
class ForwardingEngine {
public:
    ForwardingEngine(const Config::SystemConfig& system_config,
                     const std::string& link_a_port, const std::string& link_b_port,
                     Link::RadioLinkFactory link_a_factory, Link::RadioLinkFactory link_b_factory,
                     TimeUtils::InterruptibleSleep sleeper,
                     ClockSource tracker_clock = std::chrono::steady_clock::now);

    ForwardingEngine(const ForwardingEngine&) = delete;
    ForwardingEngine& operator=(const ForwardingEngine&) = delete;

    // Connects A then B; throws LinkConnectionError when either link exhausts its attempts
    void start();

    // Makes in-flight connects, retry waits and recoveries give up; links stay open
    void begin_shutdown();

    // Closes both links, logging and swallowing close errors
    void shutdown();

    void handle_inbound_packet(Link::LinkId origin_link, const Link::MeshPacket& packet);

    EngineStatistics get_stats();
    bool send_message(Link::LinkId link_id, const std::string& text, int channel);
    Link::LinkIdentity get_link_identity(Link::LinkId link_id) const;
    std::vector<MessageRecord> get_recent_messages();
    std::vector<MessageRecord> get_recent_messages(std::size_t count);

    bool all_links_connected() const;
    double get_uptime_seconds() const;

    ConnectionManager& get_connection_manager(Link::LinkId link_id);
    LinkState& get_link_state(Link::LinkId link_id);
    const LinkState& get_link_state(Link::LinkId link_id) const;
    MessageTracker& get_tracker() { return tracker; }
    std::vector<ConnectionManager*> get_connection_managers();

    void set_recovery_failure_handler(RecoveryFailureHandler handler);

private:
    const Config::SystemConfig& config;
    MessageTracker tracker;
    std::array<std::unique_ptr<LinkState>, 2> link_states;
    std::array<std::unique_ptr<ConnectionManager>, 2> connection_managers;
    std::chrono::steady_clock::time_point start_time;
};

} // namespace Bridge
} // namespace MeshBridge

#endif // FORWARDING_ENGINE_HPP
