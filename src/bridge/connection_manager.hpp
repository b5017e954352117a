#ifndef CONNECTION_MANAGER_HPP
#define CONNECTION_MANAGER_HPP

#include "link_state.hpp"
#include "configs/connection_config.hpp"
#include "link/radio_link_interface.hpp"
#include "utils/time_utils.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace MeshBridge {
namespace Bridge {

// Called with (link label, error) when a background reconnect gives up
using RecoveryFailureHandler = std::function<void(const std::string&, const std::string&)>;

/**
 * Owns the lifecycle of one radio link: bounded connect with exponential
 * backoff, reconnect on demand, and a background reconnect when the link
 * reports it was lost.
 *
 * connect() and reconnect() are serialized per link. Sends and probes work on
 * a shared copy of the active handle taken under a short lock, so a slow probe
 * never holds up forwarding and a close only waits for calls already in flight
 * on the closed handle.
 */
class ConnectionManager {
public:
    ConnectionManager(LinkState& link_state, Link::RadioLinkFactory link_factory,
                      const Config::ConnectionConfig& connection_config,
                      TimeUtils::InterruptibleSleep sleeper, const std::string& recovery_thread_tag);
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    // Must be set before connect()
    void set_receive_handler(Link::ReceiveCallback handler);
    void set_recovery_failure_handler(RecoveryFailureHandler handler);

    // Throws LinkConnectionError once every attempt has failed
    void connect();

    // Same retry policy with the link marked Recovering; ends Disconnected on failure
    void reconnect(const std::string& reason);

    // Best-effort close; errors are logged
    void disconnect();

    // Stops background recovery and makes pending retry waits give up
    void begin_shutdown();
    bool is_shutting_down() const { return shutting_down_.load(); }

    // Joins a loss-triggered recovery thread, if one was started
    void wait_for_background_recovery();

    // Throws LinkSendError, including when no link is connected
    void send(const Link::MeshPacket& packet);

    bool probe();

    // Throws LinkUnsupportedError or LinkCommandError
    void request_reboot();

    Link::LinkIdentity get_identity() const;
    bool is_connected() const;
    std::string get_link_type() const;

    LinkState& get_link_state() { return link_state_; }

    // Delay slept after the given failed attempt (1-based)
    std::chrono::milliseconds retry_delay_after_attempt(int failed_attempt) const;

private:
    void connect_with_retries(LinkStatus in_progress_status);
    void close_active_link();
    void handle_connection_lost(const std::string& reason);
    void run_background_recovery(const std::string& reason);

    LinkState& link_state_;
    Link::RadioLinkFactory link_factory_;
    const int max_attempts_;
    const double initial_retry_delay_seconds_;
    const double backoff_multiplier_;
    TimeUtils::InterruptibleSleep sleeper_;
    std::string recovery_thread_tag_;

    Link::ReceiveCallback receive_handler_;
    RecoveryFailureHandler recovery_failure_handler_;

    std::shared_ptr<Link::RadioLinkInterface> current_link() const;

    std::mutex lifecycle_mutex_;
    mutable std::mutex link_mutex_;
    std::shared_ptr<Link::RadioLinkInterface> active_link_;

    std::mutex recovery_thread_mutex_;
    std::thread recovery_thread_;
    std::atomic<bool> recovery_in_progress_{false};
    std::atomic<bool> shutting_down_{false};
};

} // namespace Bridge
} // namespace MeshBridge

#endif // CONNECTION_MANAGER_HPP
