#include <doctest/doctest.h>
#include "link/device_discovery.hpp"
#include "mock_radio_link.hpp"
#include "system/command_line.hpp"
#include "system/system_manager.hpp"
#include "system/system_state.hpp"
#include "threads/thread_logic/thread_manager.hpp"
#include <atomic>
#include <cstdio>
#include <fstream>
#include <sys/stat.h>
#include <unistd.h>
#include <memory>
#include <stdexcept>
#include <thread>

using namespace MeshBridge;
using namespace MeshBridge::System;

TEST_CASE("two positional ports select manual mode") {
    CommandLineOptions options = parse_command_line({"/dev/ttyUSB0", "/dev/ttyACM0", "--config", "bridge.csv"});

    CHECK(options.link_a_port == "/dev/ttyUSB0");
    CHECK(options.link_b_port == "/dev/ttyACM0");
    CHECK(options.config_path == "bridge.csv");
    CHECK_FALSE(options.show_help);

    Config::SystemConfig config;
    apply_command_line_ports(config, options);
    CHECK(config.links.link_a_port == "/dev/ttyUSB0");
    CHECK_FALSE(config.links.auto_detect);
}

TEST_CASE("no ports leaves auto-detect alone") {
    CommandLineOptions options = parse_command_line({"--config=bridge.csv"});
    CHECK(options.config_path == "bridge.csv");
    CHECK_FALSE(options.has_manual_ports());

    Config::SystemConfig config;
    apply_command_line_ports(config, options);
    CHECK(config.links.auto_detect);
    CHECK(config.links.link_a_port.empty());
}

TEST_CASE("malformed command lines are rejected") {
    CHECK_THROWS_AS(parse_command_line({"/dev/ttyUSB0"}), std::invalid_argument);
    CHECK_THROWS_AS(parse_command_line({"--config"}), std::invalid_argument);
    CHECK_THROWS_AS(parse_command_line({"--verbose"}), std::invalid_argument);
    CHECK(parse_command_line({"--help"}).show_help);
}

TEST_CASE("device directory listing tolerates missing directories") {
    CHECK(Link::list_device_links("/dev/mesh-bridge-no-such-directory").empty());

    std::string directory_path = "/tmp/mesh_bridge_by_id_" + std::to_string(getpid());
    std::string device_link_path = directory_path + "/usb-radio-if00";
    REQUIRE(::mkdir(directory_path.c_str(), 0700) == 0);
    { std::ofstream device_link(device_link_path); }

    std::vector<std::string> entries = Link::list_device_links(directory_path);
    REQUIRE(entries.size() == 1);
    CHECK(entries[0] == device_link_path);

    std::remove(device_link_path.c_str());
    std::remove(directory_path.c_str());
}

TEST_CASE("unclaimed ports keep discovery order") {
    std::vector<std::string> discovered_ports = {"/dev/ttyACM0", "/dev/ttyUSB0", "/dev/ttyUSB1"};

    std::vector<std::string> first_two = {"/dev/ttyACM0", "/dev/ttyUSB0"};
    CHECK(Link::select_unclaimed_ports(discovered_ports, {}, 2) == first_two);

    std::vector<std::string> claimed_ports = {"/dev/ttyACM0"};
    std::vector<std::string> next_free = {"/dev/ttyUSB0"};
    CHECK(Link::select_unclaimed_ports(discovered_ports, claimed_ports, 1) == next_free);
    CHECK(Link::select_unclaimed_ports({"/dev/ttyUSB0"}, {}, 2).size() == 1);
}

TEST_CASE("only ports that answer as radios are selected") {
    std::shared_ptr<Testing::MockRadioControl> control = std::make_shared<Testing::MockRadioControl>();
    control->open_failures_remaining.store(1);
    std::vector<std::string> discovered_ports = {"/dev/ttyACM0", "/dev/ttyUSB0", "/dev/ttyUSB1"};
    std::vector<std::string> no_claimed_ports;

    std::vector<std::string> verified_ports =
        Link::select_verified_ports(discovered_ports, no_claimed_ports, 2, Testing::make_mock_factory(control));

    std::vector<std::string> answering_ports = {"/dev/ttyUSB0", "/dev/ttyUSB1"};
    CHECK(verified_ports == answering_ports);
    CHECK(control->open_count.load() == 3);
    CHECK(control->close_count.load() == 3);
}

TEST_CASE("a port without a node identity is not a radio") {
    std::shared_ptr<Testing::MockRadioControl> control = std::make_shared<Testing::MockRadioControl>();
    control->node_id = "";

    CHECK_FALSE(Link::verify_radio_port(Testing::make_mock_factory(control), "/dev/ttyUSB0"));
    CHECK(control->close_count.load() == 1);

    std::vector<std::string> discovered_ports = {"/dev/ttyUSB0", "/dev/ttyUSB1"};
    std::vector<std::string> no_claimed_ports;
    CHECK(Link::select_verified_ports(discovered_ports, no_claimed_ports, 2, Testing::make_mock_factory(control)).empty());
}

TEST_CASE("verification stops once enough radios answered") {
    std::shared_ptr<Testing::MockRadioControl> control = std::make_shared<Testing::MockRadioControl>();
    std::vector<std::string> discovered_ports = {"/dev/ttyACM0", "/dev/ttyUSB0", "/dev/ttyUSB1"};
    std::vector<std::string> claimed_ports = {"/dev/ttyACM0"};

    std::vector<std::string> verified_ports =
        Link::select_verified_ports(discovered_ports, claimed_ports, 1, Testing::make_mock_factory(control));

    std::vector<std::string> first_free_radio = {"/dev/ttyUSB0"};
    CHECK(verified_ports == first_free_radio);
    CHECK(control->factory_count.load() == 1);
}

TEST_CASE("configured ports skip discovery") {
    Config::LinkConfig links;
    links.link_a_port = "/dev/ttyUSB0";
    links.link_b_port = "/dev/ttyUSB1";
    Config::DiscoveryConfig discovery;
    int sleep_calls = 0;
    TimeUtils::InterruptibleSleep sleeper = [&sleep_calls](std::chrono::milliseconds) {
        sleep_calls++;
        return true;
    };

    resolve_link_ports(links, discovery, sleeper, Link::RadioLinkFactory());
    CHECK(links.link_a_port == "/dev/ttyUSB0");
    CHECK(sleep_calls == 0);
}

TEST_CASE("missing ports without auto-detect are fatal") {
    Config::LinkConfig links;
    links.auto_detect = false;
    Config::DiscoveryConfig discovery;
    TimeUtils::InterruptibleSleep sleeper = [](std::chrono::milliseconds) { return true; };

    CHECK_THROWS_AS(resolve_link_ports(links, discovery, sleeper, Link::RadioLinkFactory()), std::runtime_error);
}

TEST_CASE("shutdown request wakes interruptible sleeps once") {
    Config::SystemConfig config;
    config.timing.main_loop_poll_interval_milliseconds = 20;
    SystemState system_state(config);
    TimeUtils::InterruptibleSleep sleeper = system_state.make_sleeper();

    CHECK(sleeper(std::chrono::milliseconds(1)));

    std::thread requester([&system_state]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        system_state.request_shutdown();
    });
    std::chrono::steady_clock::time_point started = std::chrono::steady_clock::now();
    CHECK_FALSE(sleeper(std::chrono::seconds(30)));
    requester.join();

    CHECK(std::chrono::steady_clock::now() - started < std::chrono::seconds(5));
    CHECK_FALSE(system_state.running.load());
    CHECK_FALSE(system_state.request_shutdown());
}

TEST_CASE("slow workers are joined, never detached") {
    Logging::LoggingContext worker_logging_context;
    worker_logging_context.console_output_enabled.store(false);
    Threads::ThreadManagerState manager_state;

    std::shared_ptr<std::atomic<int>> worker_progress = std::make_shared<std::atomic<int>>(0);
    std::vector<Threads::ThreadDefinition> thread_definitions;
    thread_definitions.emplace_back("health_monitor", [worker_progress]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        worker_progress->store(1);
    });
    REQUIRE(Threads::Manager::start_threads(manager_state, thread_definitions, worker_logging_context));

    bool stopped_in_time = Threads::Manager::shutdown_threads(manager_state, std::chrono::milliseconds(20));
    CHECK_FALSE(stopped_in_time);
    CHECK(worker_progress->load() == 1);
    CHECK(manager_state.active_threads.empty());
}

TEST_CASE("quick workers stop within the warning window") {
    Logging::LoggingContext worker_logging_context;
    worker_logging_context.console_output_enabled.store(false);
    Threads::ThreadManagerState manager_state;

    std::vector<Threads::ThreadDefinition> thread_definitions;
    thread_definitions.emplace_back("status_reporter", []() {});
    REQUIRE(Threads::Manager::start_threads(manager_state, thread_definitions, worker_logging_context));
    CHECK(Threads::Manager::shutdown_threads(manager_state, std::chrono::seconds(5)));
}
