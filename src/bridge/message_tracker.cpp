#include "message_tracker.hpp"
#include "utils/time_utils.hpp"
#include <algorithm>

namespace MeshBridge {
namespace Bridge {

namespace {
    constexpr std::size_t TEXT_SUMMARY_LENGTH = 50;

    std::string summarize_text(const std::string& text) {
        return text.size() <= TEXT_SUMMARY_LENGTH ? text : text.substr(0, TEXT_SUMMARY_LENGTH);
    }
}

MessageTracker::MessageTracker(const Config::TrackerConfig& tracker_config, ClockSource clock_source)
    : max_age(tracker_config.max_age_seconds),
      max_messages(static_cast<std::size_t>(std::max(1, tracker_config.max_messages))),
      clock(std::move(clock_source)) {}

bool MessageTracker::has_seen(const std::string& message_id) {
    std::lock_guard<std::mutex> tracker_lock(tracker_mutex);
    evict_expired_locked(clock());
    return record_index.count(message_id) > 0;
}

void MessageTracker::record(const std::string& message_id, Link::LinkId origin_link, const std::string& text_summary) {
    std::lock_guard<std::mutex> tracker_lock(tracker_mutex);
    std::chrono::steady_clock::time_point now = clock();
    evict_expired_locked(now);
    if (record_index.count(message_id) > 0) {
        return;
    }

    MessageRecord message_record;
    message_record.message_id = message_id;
    message_record.origin_link = origin_link;
    message_record.observed_time = now;
    message_record.observed_epoch_seconds = TimeUtils::get_current_epoch_seconds();
    message_record.text_summary = summarize_text(text_summary);
    insert_locked(std::move(message_record));
}

bool MessageTracker::check_and_record(const std::string& message_id, Link::LinkId origin_link) {
    Link::MeshPacket packet;
    packet.id = message_id;
    return check_and_record(packet, origin_link);
}

bool MessageTracker::check_and_record(const Link::MeshPacket& packet, Link::LinkId origin_link) {
    std::lock_guard<std::mutex> tracker_lock(tracker_mutex);
    std::chrono::steady_clock::time_point now = clock();
    evict_expired_locked(now);
    if (record_index.count(packet.id) > 0) {
        return false;
    }

    MessageRecord message_record;
    message_record.message_id = packet.id;
    message_record.origin_link = origin_link;
    message_record.observed_time = now;
    message_record.observed_epoch_seconds = TimeUtils::get_current_epoch_seconds();
    message_record.from_id = packet.from_id;
    message_record.to_id = packet.to_id;
    message_record.text_summary = summarize_text(packet.text);
    message_record.channel = packet.channel;
    insert_locked(std::move(message_record));
    return true;
}

void MessageTracker::mark_forwarded(const std::string& message_id) {
    std::lock_guard<std::mutex> tracker_lock(tracker_mutex);
    std::unordered_map<std::string, MessageRecord*>::iterator record_iterator = record_index.find(message_id);
    if (record_iterator == record_index.end()) {
        // Evicted between the forwarding decision and the send; still a forward
        total_forwarded++;
        return;
    }
    if (!record_iterator->second->forwarded) {
        record_iterator->second->forwarded = true;
        total_forwarded++;
    }
}

std::vector<MessageRecord> MessageTracker::get_recent_messages(std::size_t count) {
    std::lock_guard<std::mutex> tracker_lock(tracker_mutex);
    evict_expired_locked(clock());
    std::size_t first_index = records.size() > count ? records.size() - count : 0;
    return std::vector<MessageRecord>(records.begin() + static_cast<std::ptrdiff_t>(first_index), records.end());
}

TrackerStatistics MessageTracker::get_stats() {
    std::lock_guard<std::mutex> tracker_lock(tracker_mutex);
    evict_expired_locked(clock());
    TrackerStatistics tracker_statistics;
    tracker_statistics.total_seen = total_seen;
    tracker_statistics.total_forwarded = total_forwarded;
    tracker_statistics.currently_tracked = records.size();
    return tracker_statistics;
}

std::size_t MessageTracker::size() {
    std::lock_guard<std::mutex> tracker_lock(tracker_mutex);
    evict_expired_locked(clock());
    return records.size();
}

void MessageTracker::evict_expired_locked(std::chrono::steady_clock::time_point now) {
    while (!records.empty() && now - records.front().observed_time > max_age) {
        record_index.erase(records.front().message_id);
        records.pop_front();
    }
}

// Element addresses in a deque survive push_back/pop_front, so the index holds raw pointers
void MessageTracker::insert_locked(MessageRecord message_record) {
    while (records.size() >= max_messages) {
        record_index.erase(records.front().message_id);
        records.pop_front();
    }
    records.push_back(std::move(message_record));
    record_index[records.back().message_id] = &records.back();
    total_seen++;
}

} // namespace Bridge
} // namespace MeshBridge
