#include <doctest/doctest.h>
#include "bridge/forwarding_engine.hpp"
#include "mock_radio_link.hpp"
#include <atomic>
#include <thread>
#include <vector>

using namespace MeshBridge;
using namespace MeshBridge::Bridge;
using namespace MeshBridge::Testing;

namespace {

struct BridgeFixture {
    Config::SystemConfig config;
    std::shared_ptr<MockRadioControl> control_a = std::make_shared<MockRadioControl>();
    std::shared_ptr<MockRadioControl> control_b = std::make_shared<MockRadioControl>();
    RecordingSleeper sleeper;
    std::unique_ptr<ForwardingEngine> engine;

    BridgeFixture() {
        config.connection.max_attempts = 2;
        control_b->node_id = "!0000bbbb";
        engine.reset(new ForwardingEngine(config, "/dev/ttyUSB0", "/dev/ttyUSB1",
                                          make_mock_factory(control_a), make_mock_factory(control_b), sleeper));
        engine->start();
    }

    ~BridgeFixture() { engine->shutdown(); }
};

}

TEST_CASE("start connects both links and reports identities") {
    BridgeFixture fixture;

    CHECK(fixture.engine->all_links_connected());
    CHECK(fixture.engine->get_link_identity(Link::LinkId::LINK_A).node_id == "!0000aaaa");
    CHECK(fixture.engine->get_link_identity(Link::LinkId::LINK_B).node_id == "!0000bbbb");
    CHECK(fixture.engine->get_link_state(Link::LinkId::LINK_A).get_label() == "radio1");
    CHECK(fixture.engine->get_link_state(Link::LinkId::LINK_B).get_port() == "/dev/ttyUSB1");
}

TEST_CASE("a message from A is relayed unchanged to B") {
    BridgeFixture fixture;

    fixture.control_a->deliver(make_text_packet("m1", "hi"));

    std::vector<Link::MeshPacket> sent_on_b = fixture.control_b->get_sent_packets();
    REQUIRE(sent_on_b.size() == 1);
    CHECK(sent_on_b[0].id == "m1");
    CHECK(sent_on_b[0].from_id == "!A1");
    CHECK(sent_on_b[0].to_id == "^all");
    CHECK(sent_on_b[0].text == "hi");
    CHECK(fixture.control_a->get_sent_packets().empty());

    EngineStatistics engine_statistics = fixture.engine->get_stats();
    CHECK(engine_statistics.link_a.received == 1);
    CHECK(engine_statistics.link_b.sent == 1);
    CHECK(engine_statistics.tracker.total_forwarded == 1);
}

TEST_CASE("relay is symmetric") {
    BridgeFixture fixture;

    fixture.control_b->deliver(make_text_packet("m2", "hello back", "!B2"));

    std::vector<Link::MeshPacket> sent_on_a = fixture.control_a->get_sent_packets();
    REQUIRE(sent_on_a.size() == 1);
    CHECK(sent_on_a[0].text == "hello back");
    CHECK(fixture.engine->get_stats().link_b.received == 1);
}

TEST_CASE("the echo of a forwarded message is suppressed") {
    BridgeFixture fixture;

    fixture.control_a->deliver(make_text_packet("m1", "hi"));
    // B's mesh hears its own rebroadcast and hands it back
    fixture.control_b->deliver(make_text_packet("m1", "hi"));
    fixture.control_a->deliver(make_text_packet("m1", "hi"));

    CHECK(fixture.control_b->get_sent_packets().size() == 1);
    CHECK(fixture.control_a->get_sent_packets().empty());

    EngineStatistics engine_statistics = fixture.engine->get_stats();
    CHECK(engine_statistics.link_a.duplicates_suppressed == 1);
    CHECK(engine_statistics.link_b.duplicates_suppressed == 1);
    CHECK(engine_statistics.duplicates_suppressed() == 2);
    CHECK(engine_statistics.tracker.total_seen == 1);
}

TEST_CASE("a failed send counts against the target link only") {
    BridgeFixture fixture;
    fixture.control_b->fail_sends.store(true);

    fixture.control_a->deliver(make_text_packet("m1", "hi"));

    EngineStatistics engine_statistics = fixture.engine->get_stats();
    CHECK(engine_statistics.link_b.errors == 1);
    CHECK(engine_statistics.link_a.errors == 0);
    CHECK(engine_statistics.link_a.received == 1);
    CHECK(engine_statistics.tracker.total_forwarded == 0);
    CHECK_FALSE(fixture.engine->get_link_state(Link::LinkId::LINK_B).get_last_error().empty());

    // The other direction keeps working
    fixture.control_b->deliver(make_text_packet("m2", "still here"));
    CHECK(fixture.control_a->get_sent_packets().size() == 1);
}

TEST_CASE("a disconnected link fails alone while the other keeps receiving") {
    BridgeFixture fixture;
    fixture.engine->get_connection_manager(Link::LinkId::LINK_A).disconnect();
    REQUIRE(fixture.engine->get_link_state(Link::LinkId::LINK_A).get_status() == LinkStatus::DISCONNECTED);

    fixture.control_b->deliver(make_text_packet("m1", "anyone there", "!B2"));
    fixture.control_b->deliver(make_text_packet("m2", "still talking", "!B2"));

    EngineStatistics engine_statistics = fixture.engine->get_stats();
    CHECK(engine_statistics.link_a.errors == 2);
    CHECK(engine_statistics.link_a.sent == 0);
    CHECK(engine_statistics.link_b.received == 2);
    CHECK(engine_statistics.link_b.errors == 0);
    CHECK(fixture.engine->get_link_state(Link::LinkId::LINK_A).get_status() == LinkStatus::DISCONNECTED);
    CHECK(fixture.engine->get_link_state(Link::LinkId::LINK_B).get_status() == LinkStatus::CONNECTED);
    CHECK(fixture.control_a->get_sent_packets().empty());
    CHECK_FALSE(fixture.engine->all_links_connected());
}

TEST_CASE("simultaneous copies from both links are forwarded once") {
    BridgeFixture fixture;
    constexpr int delivery_thread_count = 8;
    Link::MeshPacket packet = make_text_packet("m1", "heard by both radios");

    std::atomic<bool> start_gate{false};
    std::vector<std::thread> delivery_threads;
    for (int thread_index = 0; thread_index < delivery_thread_count; ++thread_index) {
        Link::LinkId origin_link = thread_index % 2 == 0 ? Link::LinkId::LINK_A : Link::LinkId::LINK_B;
        ForwardingEngine* engine = fixture.engine.get();
        delivery_threads.emplace_back([engine, &start_gate, &packet, origin_link]() {
            while (!start_gate.load()) {
                std::this_thread::yield();
            }
            engine->handle_inbound_packet(origin_link, packet);
        });
    }
    start_gate.store(true);
    for (std::thread& delivery_thread : delivery_threads) {
        delivery_thread.join();
    }

    std::size_t total_sends = fixture.control_a->get_sent_packets().size() + fixture.control_b->get_sent_packets().size();
    CHECK(total_sends == 1);

    EngineStatistics engine_statistics = fixture.engine->get_stats();
    CHECK(engine_statistics.link_a.received + engine_statistics.link_b.received == 1);
    CHECK(engine_statistics.link_a.sent + engine_statistics.link_b.sent == 1);
    CHECK(engine_statistics.duplicates_suppressed() == static_cast<uint64_t>(delivery_thread_count - 1));
    CHECK(engine_statistics.tracker.total_seen == 1);
}

TEST_CASE("malformed text packets are counted as origin errors") {
    BridgeFixture fixture;

    fixture.control_a->deliver(make_text_packet("", "no id"));
    fixture.control_a->deliver(make_text_packet("m3", ""));

    CHECK(fixture.engine->get_stats().link_a.errors == 2);
    CHECK(fixture.control_b->get_sent_packets().empty());
}

TEST_CASE("non-text packets are ignored") {
    BridgeFixture fixture;

    Link::MeshPacket position_packet = make_text_packet("p1", "");
    position_packet.portnum = "POSITION_APP";
    fixture.control_a->deliver(position_packet);

    EngineStatistics engine_statistics = fixture.engine->get_stats();
    CHECK(engine_statistics.link_a.received == 0);
    CHECK(engine_statistics.link_a.errors == 0);
    CHECK(engine_statistics.tracker.total_seen == 0);
}

TEST_CASE("send_message broadcasts on the chosen link") {
    BridgeFixture fixture;

    CHECK(fixture.engine->send_message(Link::LinkId::LINK_B, "operator note", 1));

    std::vector<Link::MeshPacket> sent_on_b = fixture.control_b->get_sent_packets();
    REQUIRE(sent_on_b.size() == 1);
    CHECK(sent_on_b[0].to_id == "^all");
    CHECK(sent_on_b[0].channel == 1);

    fixture.control_a->fail_sends.store(true);
    CHECK_FALSE(fixture.engine->send_message(Link::LinkId::LINK_A, "lost", 0));
    CHECK(fixture.engine->get_stats().link_a.errors == 1);
}

TEST_CASE("start fails when a radio never opens") {
    Config::SystemConfig config;
    config.connection.max_attempts = 2;
    std::shared_ptr<MockRadioControl> control_a = std::make_shared<MockRadioControl>();
    std::shared_ptr<MockRadioControl> control_b = std::make_shared<MockRadioControl>();
    control_b->open_failures_remaining.store(10);
    RecordingSleeper sleeper;

    ForwardingEngine engine(config, "/dev/ttyUSB0", "/dev/ttyUSB1",
                            make_mock_factory(control_a), make_mock_factory(control_b), sleeper);

    CHECK_THROWS_AS(engine.start(), Link::LinkConnectionError);
    CHECK(engine.get_link_state(Link::LinkId::LINK_B).get_status() == LinkStatus::DISCONNECTED);
    CHECK_FALSE(engine.all_links_connected());
    engine.shutdown();
}

TEST_CASE("recent messages reflect forwarded traffic") {
    BridgeFixture fixture;

    fixture.control_a->deliver(make_text_packet("m1", "one"));
    fixture.control_b->deliver(make_text_packet("m2", "two"));

    std::vector<MessageRecord> recent = fixture.engine->get_recent_messages();
    REQUIRE(recent.size() == 2);
    CHECK(recent[0].origin_link == Link::LinkId::LINK_A);
    CHECK(recent[1].origin_link == Link::LinkId::LINK_B);
    CHECK(recent[1].forwarded);
}
