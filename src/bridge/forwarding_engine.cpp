#include "forwarding_engine.hpp"
#include "logging/logs/bridge_logs.hpp"

using MeshBridge::Logging::BridgeLogs;

namespace MeshBridge {
namespace Bridge {

ForwardingEngine::ForwardingEngine(const Config::SystemConfig& system_config,
                                   const std::string& link_a_port, const std::string& link_b_port,
                                   Link::RadioLinkFactory link_a_factory, Link::RadioLinkFactory link_b_factory,
                                   TimeUtils::InterruptibleSleep sleeper, ClockSource tracker_clock)
    : config(system_config),
      tracker(system_config.tracker, std::move(tracker_clock)),
      start_time(std::chrono::steady_clock::now()) {
    link_states[0].reset(new LinkState(config.links.link_a_label, link_a_port));
    link_states[1].reset(new LinkState(config.links.link_b_label, link_b_port));

    connection_managers[0].reset(new ConnectionManager(*link_states[0], std::move(link_a_factory),
                                                       config.connection, sleeper, "RECOV"));
    connection_managers[1].reset(new ConnectionManager(*link_states[1], std::move(link_b_factory),
                                                       config.connection, sleeper, "RECOV"));

    connection_managers[0]->set_receive_handler([this](const Link::MeshPacket& packet) {
        handle_inbound_packet(Link::LinkId::LINK_A, packet);
    });
    connection_managers[1]->set_receive_handler([this](const Link::MeshPacket& packet) {
        handle_inbound_packet(Link::LinkId::LINK_B, packet);
    });
}

void ForwardingEngine::start() {
    BridgeLogs::log_bridge_starting();
    start_time = std::chrono::steady_clock::now();

    for (std::size_t link_position = 0; link_position < connection_managers.size(); ++link_position) {
        connection_managers[link_position]->connect();
        Link::LinkIdentity identity = connection_managers[link_position]->get_identity();
        BridgeLogs::log_link_identity(link_states[link_position]->get_label(),
                                      identity.is_known() ? identity.node_id : "unknown", identity.hw_model);
    }
    BridgeLogs::log_bridge_running();
}

void ForwardingEngine::begin_shutdown() {
    for (std::unique_ptr<ConnectionManager>& connection_manager : connection_managers) {
        connection_manager->begin_shutdown();
    }
}

void ForwardingEngine::shutdown() {
    BridgeLogs::log_bridge_closing();
    begin_shutdown();
    for (std::unique_ptr<ConnectionManager>& connection_manager : connection_managers) {
        connection_manager->wait_for_background_recovery();
    }
    for (std::unique_ptr<ConnectionManager>& connection_manager : connection_managers) {
        try {
            connection_manager->disconnect();
        } catch (const std::exception& disconnect_exception_error) {
            BridgeLogs::log_receive_error(connection_manager->get_link_state().get_label(), disconnect_exception_error.what());
        }
    }
    BridgeLogs::log_bridge_closed();
}

void ForwardingEngine::handle_inbound_packet(Link::LinkId origin_link, const Link::MeshPacket& packet) {
    LinkState& origin_state = get_link_state(origin_link);

    try {
        if (!packet.is_text_message()) {
            return;
        }
        if (packet.id.empty()) {
            throw Link::LinkProtocolError("text packet from " + packet.from_id + " has no id");
        }
        if (packet.text.empty()) {
            throw Link::LinkProtocolError("packet " + packet.id + " has an empty text payload");
        }

        if (!tracker.check_and_record(packet, origin_link)) {
            origin_state.get_statistics().increment_duplicates_suppressed();
            BridgeLogs::log_duplicate_suppressed(origin_state.get_label(), packet.id);
            return;
        }

        origin_state.get_statistics().increment_received();
        BridgeLogs::log_message_received(origin_state.get_label(), packet.from_id, packet.text);

        Link::LinkId target_link = Link::opposite_link(origin_link);
        LinkState& target_state = get_link_state(target_link);
        try {
            get_connection_manager(target_link).send(packet);
            target_state.get_statistics().increment_sent();
            tracker.mark_forwarded(packet.id);
            BridgeLogs::log_message_forwarded(origin_state.get_label(), target_state.get_label(), packet.id);
        } catch (const Link::LinkSendError& send_exception_error) {
            target_state.get_statistics().increment_errors();
            target_state.set_last_error(send_exception_error.what());
            BridgeLogs::log_forward_failed(target_state.get_label(), packet.id, send_exception_error.what());
        }
    } catch (const Link::LinkProtocolError& protocol_exception_error) {
        origin_state.get_statistics().increment_errors();
        BridgeLogs::log_protocol_error(origin_state.get_label(), protocol_exception_error.what());
    } catch (const std::exception& receive_exception_error) {
        origin_state.get_statistics().increment_errors();
        BridgeLogs::log_receive_error(origin_state.get_label(), receive_exception_error.what());
    }
}

EngineStatistics ForwardingEngine::get_stats() {
    EngineStatistics engine_statistics;
    engine_statistics.link_a = link_states[0]->get_statistics().snapshot();
    engine_statistics.link_b = link_states[1]->get_statistics().snapshot();
    engine_statistics.tracker = tracker.get_stats();
    return engine_statistics;
}

bool ForwardingEngine::send_message(Link::LinkId link_id, const std::string& text, int channel) {
    LinkState& link_state = get_link_state(link_id);
    Link::MeshPacket packet;
    packet.to_id = Link::BROADCAST_ADDRESS;
    packet.text = text;
    packet.channel = channel;

    try {
        get_connection_manager(link_id).send(packet);
        link_state.get_statistics().increment_sent();
        BridgeLogs::log_injected_message(link_state.get_label(), text);
        return true;
    } catch (const Link::LinkError& send_exception_error) {
        link_state.get_statistics().increment_errors();
        BridgeLogs::log_injected_message_failed(link_state.get_label(), send_exception_error.what());
        return false;
    }
}

Link::LinkIdentity ForwardingEngine::get_link_identity(Link::LinkId link_id) const {
    return connection_managers[Link::link_index(link_id)]->get_identity();
}

std::vector<MessageRecord> ForwardingEngine::get_recent_messages() {
    return tracker.get_recent_messages(static_cast<std::size_t>(config.tracker.recent_messages_count));
}

std::vector<MessageRecord> ForwardingEngine::get_recent_messages(std::size_t count) {
    return tracker.get_recent_messages(count);
}

bool ForwardingEngine::all_links_connected() const {
    for (const std::unique_ptr<LinkState>& link_state : link_states) {
        if (link_state->get_status() != LinkStatus::CONNECTED) {
            return false;
        }
    }
    return true;
}

double ForwardingEngine::get_uptime_seconds() const {
    return TimeUtils::seconds_since(start_time);
}

ConnectionManager& ForwardingEngine::get_connection_manager(Link::LinkId link_id) {
    return *connection_managers[Link::link_index(link_id)];
}

LinkState& ForwardingEngine::get_link_state(Link::LinkId link_id) {
    return *link_states[Link::link_index(link_id)];
}

const LinkState& ForwardingEngine::get_link_state(Link::LinkId link_id) const {
    return *link_states[Link::link_index(link_id)];
}

std::vector<ConnectionManager*> ForwardingEngine::get_connection_managers() {
    return {connection_managers[0].get(), connection_managers[1].get()};
}

void ForwardingEngine::set_recovery_failure_handler(RecoveryFailureHandler handler) {
    for (std::unique_ptr<ConnectionManager>& connection_manager : connection_managers) {
        connection_manager->set_recovery_failure_handler(handler);
    }
}

} // namespace Bridge
} // namespace MeshBridge
