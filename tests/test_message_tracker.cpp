#include <doctest/doctest.h>
#include "bridge/message_tracker.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

using namespace MeshBridge;
using namespace MeshBridge::Bridge;

namespace {

struct FakeClock {
    std::shared_ptr<std::chrono::steady_clock::time_point> now =
        std::make_shared<std::chrono::steady_clock::time_point>(std::chrono::steady_clock::time_point() + std::chrono::hours(1));

    ClockSource source() const {
        std::shared_ptr<std::chrono::steady_clock::time_point> shared_now = now;
        return [shared_now]() { return *shared_now; };
    }
    void advance(std::chrono::seconds delta) { *now += delta; }
};

}

TEST_CASE("check_and_record admits an id once") {
    Config::TrackerConfig tracker_config;
    MessageTracker tracker(tracker_config);

    CHECK(tracker.check_and_record("m1", Link::LinkId::LINK_A) == true);
    CHECK(tracker.check_and_record("m1", Link::LinkId::LINK_A) == false);
    CHECK(tracker.check_and_record("m1", Link::LinkId::LINK_B) == false);
    CHECK(tracker.has_seen("m1"));
    CHECK_FALSE(tracker.has_seen("m2"));
    CHECK(tracker.get_stats().total_seen == 1);
}

TEST_CASE("concurrent sightings from both links admit an id exactly once") {
    Config::TrackerConfig tracker_config;
    MessageTracker tracker(tracker_config);
    constexpr int sighting_thread_count = 8;

    std::atomic<bool> start_gate{false};
    std::atomic<int> admitted_count{0};
    std::vector<std::thread> sighting_threads;
    for (int thread_index = 0; thread_index < sighting_thread_count; ++thread_index) {
        Link::LinkId origin_link = thread_index % 2 == 0 ? Link::LinkId::LINK_A : Link::LinkId::LINK_B;
        sighting_threads.emplace_back([&tracker, &start_gate, &admitted_count, origin_link]() {
            while (!start_gate.load()) {
                std::this_thread::yield();
            }
            if (tracker.check_and_record("shared-id", origin_link)) {
                admitted_count.fetch_add(1);
            }
        });
    }
    start_gate.store(true);
    for (std::thread& sighting_thread : sighting_threads) {
        sighting_thread.join();
    }

    CHECK(admitted_count.load() == 1);
    CHECK(tracker.get_stats().total_seen == 1);
}

TEST_CASE("record is a no-op for a tracked id") {
    Config::TrackerConfig tracker_config;
    MessageTracker tracker(tracker_config);

    tracker.record("m1", Link::LinkId::LINK_A, "first");
    tracker.record("m1", Link::LinkId::LINK_B, "second");

    std::vector<MessageRecord> recent = tracker.get_recent_messages(10);
    REQUIRE(recent.size() == 1);
    CHECK(recent[0].text_summary == "first");
    CHECK(recent[0].origin_link == Link::LinkId::LINK_A);
}

TEST_CASE("count bound evicts the oldest records first") {
    Config::TrackerConfig tracker_config;
    tracker_config.max_messages = 1000;
    MessageTracker tracker(tracker_config);

    for (int message_index = 0; message_index < 1500; ++message_index) {
        REQUIRE(tracker.check_and_record("id-" + std::to_string(message_index), Link::LinkId::LINK_A));
    }

    CHECK(tracker.size() == 1000);
    for (int message_index = 0; message_index < 500; ++message_index) {
        CHECK_FALSE(tracker.has_seen("id-" + std::to_string(message_index)));
    }
    CHECK(tracker.has_seen("id-500"));
    CHECK(tracker.has_seen("id-1499"));
    CHECK(tracker.get_stats().total_seen == 1500);
}

TEST_CASE("records older than max age are forgotten") {
    Config::TrackerConfig tracker_config;
    tracker_config.max_age_seconds = 600;
    FakeClock fake_clock;
    MessageTracker tracker(tracker_config, fake_clock.source());

    REQUIRE(tracker.check_and_record("old", Link::LinkId::LINK_A));
    fake_clock.advance(std::chrono::seconds(300));
    REQUIRE(tracker.check_and_record("newer", Link::LinkId::LINK_B));

    fake_clock.advance(std::chrono::seconds(300));
    CHECK(tracker.has_seen("old"));

    fake_clock.advance(std::chrono::seconds(1));
    CHECK_FALSE(tracker.has_seen("old"));
    CHECK(tracker.has_seen("newer"));

    // An expired id is new again
    CHECK(tracker.check_and_record("old", Link::LinkId::LINK_A));
}

TEST_CASE("recent messages come back newest last with packet details") {
    Config::TrackerConfig tracker_config;
    MessageTracker tracker(tracker_config);

    Link::MeshPacket packet;
    packet.from_id = "!A1";
    packet.to_id = "^all";
    packet.channel = 2;
    packet.text = std::string(80, 'x');
    for (int message_index = 0; message_index < 5; ++message_index) {
        packet.id = "m" + std::to_string(message_index);
        tracker.check_and_record(packet, Link::LinkId::LINK_A);
    }

    std::vector<MessageRecord> recent = tracker.get_recent_messages(3);
    REQUIRE(recent.size() == 3);
    CHECK(recent[0].message_id == "m2");
    CHECK(recent[2].message_id == "m4");
    CHECK(recent[2].from_id == "!A1");
    CHECK(recent[2].channel == 2);
    CHECK(recent[2].text_summary.size() == 50);
}

TEST_CASE("mark_forwarded counts each message once") {
    Config::TrackerConfig tracker_config;
    MessageTracker tracker(tracker_config);

    tracker.check_and_record("m1", Link::LinkId::LINK_A);
    tracker.mark_forwarded("m1");
    tracker.mark_forwarded("m1");

    TrackerStatistics tracker_statistics = tracker.get_stats();
    CHECK(tracker_statistics.total_forwarded == 1);
    CHECK(tracker_statistics.currently_tracked == 1);
    CHECK(tracker.get_recent_messages(1)[0].forwarded);
}
