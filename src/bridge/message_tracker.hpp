#ifndef MESSAGE_TRACKER_HPP
#define MESSAGE_TRACKER_HPP

#include "configs/tracker_config.hpp"
#include "link/mesh_packet.hpp"
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace MeshBridge {
namespace Bridge {

using ClockSource = std::function<std::chrono::steady_clock::time_point()>;

struct MessageRecord {
    std::string message_id;
    Link::LinkId origin_link = Link::LinkId::LINK_A;
    std::chrono::steady_clock::time_point observed_time;
    double observed_epoch_seconds = 0.0;
    std::string from_id;
    std::string to_id;
    std::string text_summary;
    int channel = 0;
    bool forwarded = false;
};

struct TrackerStatistics {
    uint64_t total_seen = 0;
    uint64_t total_forwarded = 0;
    std::size_t currently_tracked = 0;
};

/**
 * Recently seen message ids, bounded by age and by count.
 *
 * Records are kept in insertion order; the oldest go first under either bound.
 * Age eviction runs on every access. All operations take the same lock, so
 * check_and_record() is atomic with respect to concurrent callers.
 */
class MessageTracker {
public:
    explicit MessageTracker(const Config::TrackerConfig& tracker_config,
                            ClockSource clock_source = std::chrono::steady_clock::now);

    bool has_seen(const std::string& message_id);

    // No-op when the id is already tracked
    void record(const std::string& message_id, Link::LinkId origin_link, const std::string& text_summary);

    // True when the id was new and has now been recorded; false for a duplicate
    bool check_and_record(const std::string& message_id, Link::LinkId origin_link);
    bool check_and_record(const Link::MeshPacket& packet, Link::LinkId origin_link);

    void mark_forwarded(const std::string& message_id);

    // Newest last
    std::vector<MessageRecord> get_recent_messages(std::size_t count);
    TrackerStatistics get_stats();
    std::size_t size();

private:
    void evict_expired_locked(std::chrono::steady_clock::time_point now);
    void insert_locked(MessageRecord message_record);

    const std::chrono::seconds max_age;
    const std::size_t max_messages;
    ClockSource clock;

    std::mutex tracker_mutex;
    std::deque<MessageRecord> records;
    std::unordered_map<std::string, MessageRecord*> record_index;
    uint64_t total_seen = 0;
    uint64_t total_forwarded = 0;
};

} // namespace Bridge
} // namespace MeshBridge

#endif // MESSAGE_TRACKER_HPP
