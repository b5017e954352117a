#ifndef LINK_STATE_HPP
#define LINK_STATE_HPP

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>

namespace MeshBridge {
namespace Bridge {

enum class LinkStatus {
    DISCONNECTED,
    CONNECTING,
    CONNECTED,
    RECOVERING
};

const char* link_status_to_string(LinkStatus link_status);

struct LinkStatisticsSnapshot {
    uint64_t received = 0;
    uint64_t sent = 0;
    uint64_t errors = 0;
    uint64_t duplicates_suppressed = 0;
};

// Counters touched from both links' reader threads and the health thread
class LinkStatistics {
public:
    void increment_received() { received.fetch_add(1); }
    void increment_sent() { sent.fetch_add(1); }
    void increment_errors() { errors.fetch_add(1); }
    void increment_duplicates_suppressed() { duplicates_suppressed.fetch_add(1); }

    LinkStatisticsSnapshot snapshot() const;

private:
    std::atomic<uint64_t> received{0};
    std::atomic<uint64_t> sent{0};
    std::atomic<uint64_t> errors{0};
    std::atomic<uint64_t> duplicates_suppressed{0};
};

struct LinkStateSnapshot {
    std::string label;
    LinkStatus status = LinkStatus::DISCONNECTED;
    int consecutive_health_failures = 0;
    std::string last_error;
    std::string port;
    std::string node_id;
    LinkStatisticsSnapshot statistics;
};

/**
 * Shared per-link state. Written by the link's ConnectionManager and by the
 * HealthMonitor; read by the forwarding path and the status reporter.
 */
class LinkState {
public:
    LinkState(const std::string& link_label, const std::string& port_identifier);

    const std::string& get_label() const { return label; }

    LinkStatus get_status() const { return status.load(); }
    void set_status(LinkStatus new_status) { status.store(new_status); }

    int increment_health_failures() { return consecutive_health_failures.fetch_add(1) + 1; }
    void reset_health_failures() { consecutive_health_failures.store(0); }
    int get_health_failures() const { return consecutive_health_failures.load(); }

    void set_last_error(const std::string& error_message);
    void clear_last_error();
    std::string get_last_error() const;

    void set_port(const std::string& port_identifier);
    std::string get_port() const;

    void set_node_id(const std::string& node_id_value);
    std::string get_node_id() const;

    LinkStatistics& get_statistics() { return statistics; }
    const LinkStatistics& get_statistics() const { return statistics; }

    LinkStateSnapshot snapshot() const;

private:
    const std::string label;
    std::atomic<LinkStatus> status{LinkStatus::DISCONNECTED};
    std::atomic<int> consecutive_health_failures{0};

    mutable std::mutex detail_mutex;
    std::string last_error;
    std::string port;
    std::string node_id;

    LinkStatistics statistics;
};

} // namespace Bridge
} // namespace MeshBridge

#endif // LINK_STATE_HPP
