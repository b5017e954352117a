#include <doctest/doctest.h>
#include "monitoring/health_monitor.hpp"
#include "mock_radio_link.hpp"

using namespace MeshBridge;
using namespace MeshBridge::Bridge;
using namespace MeshBridge::Monitoring;
using namespace MeshBridge::Testing;

namespace {

struct MonitoredLink {
    Config::ConnectionConfig connection_config;
    Config::HealthConfig health_config;
    std::shared_ptr<MockRadioControl> control = std::make_shared<MockRadioControl>();
    RecordingSleeper sleeper;
    LinkState link_state{"radio1", "/dev/ttyUSB0"};
    std::unique_ptr<ConnectionManager> connection_manager;

    MonitoredLink() {
        connection_config.max_attempts = 2;
        health_config.failure_threshold = 3;
        health_config.reboot_settle_seconds = 10;
        connection_manager.reset(new ConnectionManager(link_state, make_mock_factory(control),
                                                       connection_config, sleeper, "RECOV"));
        connection_manager->connect();
    }

    HealthMonitor make_monitor() {
        return HealthMonitor({connection_manager.get()}, health_config, sleeper);
    }
};

}

TEST_CASE("responsive link stays healthy") {
    MonitoredLink monitored_link;
    HealthMonitor health_monitor = monitored_link.make_monitor();

    CHECK(health_monitor.check_link(*monitored_link.connection_manager) == HealthCheckOutcome::HEALTHY);
    CHECK(monitored_link.link_state.get_health_failures() == 0);
    CHECK(monitored_link.control->reboot_count.load() == 0);
}

TEST_CASE("failures below the threshold take no action") {
    MonitoredLink monitored_link;
    monitored_link.control->responsive.store(false);
    HealthMonitor health_monitor = monitored_link.make_monitor();

    CHECK(health_monitor.check_link(*monitored_link.connection_manager) == HealthCheckOutcome::PROBE_FAILED);
    CHECK(health_monitor.check_link(*monitored_link.connection_manager) == HealthCheckOutcome::PROBE_FAILED);

    CHECK(monitored_link.link_state.get_health_failures() == 2);
    CHECK(monitored_link.control->reboot_count.load() == 0);
    CHECK(monitored_link.control->factory_count.load() == 1);
}

TEST_CASE("a passing probe clears the failure count") {
    MonitoredLink monitored_link;
    monitored_link.control->responsive.store(false);
    HealthMonitor health_monitor = monitored_link.make_monitor();

    health_monitor.check_link(*monitored_link.connection_manager);
    health_monitor.check_link(*monitored_link.connection_manager);
    monitored_link.control->responsive.store(true);
    health_monitor.check_link(*monitored_link.connection_manager);

    CHECK(monitored_link.link_state.get_health_failures() == 0);
}

TEST_CASE("third failure reboots, settles, reconnects and resets the count") {
    MonitoredLink monitored_link;
    monitored_link.control->responsive.store(false);
    HealthMonitor health_monitor = monitored_link.make_monitor();

    health_monitor.run_health_check_cycle();
    health_monitor.run_health_check_cycle();
    REQUIRE(monitored_link.sleeper.delays->empty());

    CHECK(health_monitor.check_link(*monitored_link.connection_manager) == HealthCheckOutcome::RECOVERED);

    CHECK(monitored_link.control->reboot_count.load() == 1);
    CHECK(monitored_link.control->factory_count.load() == 2);
    REQUIRE(monitored_link.sleeper.delays->size() == 1);
    CHECK(monitored_link.sleeper.delays->at(0) == std::chrono::seconds(10));
    CHECK(monitored_link.link_state.get_health_failures() == 0);
    CHECK(monitored_link.link_state.get_status() == LinkStatus::CONNECTED);
}

TEST_CASE("unsupported reboot goes straight to reconnect") {
    MonitoredLink monitored_link;
    monitored_link.control->responsive.store(false);
    monitored_link.control->reboot_behavior = RebootBehavior::UNSUPPORTED;
    monitored_link.health_config.failure_threshold = 1;
    HealthMonitor health_monitor = monitored_link.make_monitor();

    CHECK(health_monitor.check_link(*monitored_link.connection_manager) == HealthCheckOutcome::RECOVERED);
    CHECK(monitored_link.sleeper.delays->empty());
    CHECK(monitored_link.control->factory_count.load() == 2);
}

TEST_CASE("rejected reboot command still reconnects") {
    MonitoredLink monitored_link;
    monitored_link.control->responsive.store(false);
    monitored_link.control->reboot_behavior = RebootBehavior::COMMAND_ERROR;
    monitored_link.health_config.failure_threshold = 1;
    HealthMonitor health_monitor = monitored_link.make_monitor();

    CHECK(health_monitor.check_link(*monitored_link.connection_manager) == HealthCheckOutcome::RECOVERED);
    CHECK(monitored_link.control->factory_count.load() == 2);
}

TEST_CASE("failed reconnect leaves the link disconnected and reports it") {
    MonitoredLink monitored_link;
    monitored_link.control->responsive.store(false);
    monitored_link.health_config.failure_threshold = 1;
    HealthMonitor health_monitor = monitored_link.make_monitor();

    std::string reported_label;
    health_monitor.set_recovery_failure_handler([&reported_label](const std::string& link_label, const std::string&) {
        reported_label = link_label;
    });
    monitored_link.control->open_failures_remaining.store(10);

    CHECK_NOTHROW(health_monitor.run_health_check_cycle());

    CHECK(reported_label == "radio1");
    CHECK(monitored_link.link_state.get_status() == LinkStatus::DISCONNECTED);
    CHECK(monitored_link.link_state.get_health_failures() == 0);
}

TEST_CASE("shutdown during the settle wait aborts the escalation") {
    MonitoredLink monitored_link;
    monitored_link.control->responsive.store(false);
    monitored_link.health_config.failure_threshold = 1;
    monitored_link.sleeper.interrupted->store(true);
    HealthMonitor health_monitor = monitored_link.make_monitor();

    CHECK(health_monitor.check_link(*monitored_link.connection_manager) == HealthCheckOutcome::ESCALATION_ABORTED);
    CHECK(monitored_link.control->factory_count.load() == 1);
}

TEST_CASE("reconnect cut short by shutdown raises no degraded alert") {
    MonitoredLink monitored_link;
    monitored_link.control->responsive.store(false);
    monitored_link.control->reboot_behavior = RebootBehavior::UNSUPPORTED;
    monitored_link.health_config.failure_threshold = 1;
    HealthMonitor health_monitor = monitored_link.make_monitor();

    int failure_reports = 0;
    health_monitor.set_recovery_failure_handler([&failure_reports](const std::string&, const std::string&) {
        failure_reports++;
    });
    monitored_link.connection_manager->begin_shutdown();

    CHECK(health_monitor.check_link(*monitored_link.connection_manager) == HealthCheckOutcome::ESCALATION_ABORTED);
    CHECK(failure_reports == 0);
    CHECK(monitored_link.link_state.get_health_failures() == 0);
    CHECK(monitored_link.control->factory_count.load() == 1);
}

TEST_CASE("links under recovery are not probed") {
    MonitoredLink monitored_link;
    monitored_link.link_state.set_status(LinkStatus::RECOVERING);
    HealthMonitor health_monitor = monitored_link.make_monitor();

    CHECK(health_monitor.check_link(*monitored_link.connection_manager) == HealthCheckOutcome::RECOVERY_IN_PROGRESS);
    CHECK(monitored_link.control->probe_count.load() == 0);
}
