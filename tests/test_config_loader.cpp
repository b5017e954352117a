#include <doctest/doctest.h>
#include "configs/config_loader.hpp"
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <unistd.h>

using namespace MeshBridge::Config;

namespace {

std::string write_config_file(const std::string& name, const std::string& contents) {
    std::string config_path = "/tmp/mesh_bridge_" + name + "_" + std::to_string(getpid()) + ".csv";
    std::ofstream config_stream(config_path, std::ios::trunc);
    config_stream << contents;
    return config_path;
}

}

TEST_CASE("CSV values override defaults and comments are skipped") {
    std::string config_path = write_config_file("override",
        "# key,value\n"
        "links.link_a_port,/dev/ttyUSB3\n"
        "links.link_b_label, north \n"
        "links.auto_detect,false\n"
        "connection.backoff_multiplier,1.5\n"
        "health.failure_threshold,4\n"
        "status.webhook_url,\n"
        "unknown.key,ignored\n");

    SystemConfig config;
    std::string error_message;
    REQUIRE(load_config_from_csv(config, config_path, error_message));

    CHECK(config.links.link_a_port == "/dev/ttyUSB3");
    CHECK(config.links.link_b_label == "north");
    CHECK_FALSE(config.links.auto_detect);
    CHECK(config.connection.backoff_multiplier == doctest::Approx(1.5));
    CHECK(config.health.failure_threshold == 4);
    CHECK(config.status.webhook_url.empty());
    CHECK(config.tracker.max_messages == 1000);
    std::remove(config_path.c_str());
}

TEST_CASE("unparsable number names the key") {
    std::string config_path = write_config_file("bad_value", "tracker.max_messages,lots\n");

    SystemConfig config;
    std::string error_message;
    CHECK_FALSE(load_config_from_csv(config, config_path, error_message));
    CHECK(error_message.find("tracker.max_messages") != std::string::npos);
    std::remove(config_path.c_str());
}

TEST_CASE("validation rejects inconsistent settings") {
    std::string error_message;

    SystemConfig default_config;
    CHECK(validate_config(default_config, error_message));

    SystemConfig same_labels;
    same_labels.links.link_b_label = same_labels.links.link_a_label;
    CHECK_FALSE(validate_config(same_labels, error_message));

    SystemConfig same_ports;
    same_ports.links.link_a_port = "/dev/ttyUSB0";
    same_ports.links.link_b_port = "/dev/ttyUSB0";
    CHECK_FALSE(validate_config(same_ports, error_message));

    SystemConfig shrinking_backoff;
    shrinking_backoff.connection.backoff_multiplier = 0.5;
    CHECK_FALSE(validate_config(shrinking_backoff, error_message));
    CHECK(error_message.find("backoff_multiplier") != std::string::npos);

    SystemConfig no_threshold;
    no_threshold.health.failure_threshold = 0;
    CHECK_FALSE(validate_config(no_threshold, error_message));
}

TEST_CASE("config path resolution prefers the explicit path, then the environment") {
    unsetenv(CONFIG_PATH_ENV_VARIABLE);
    CHECK(resolve_config_path("") == DEFAULT_CONFIG_PATH);
    CHECK(resolve_config_path("custom.csv") == "custom.csv");

    setenv(CONFIG_PATH_ENV_VARIABLE, "/etc/mesh-bridge.csv", 1);
    CHECK(resolve_config_path("") == "/etc/mesh-bridge.csv");
    CHECK(resolve_config_path("custom.csv") == "custom.csv");
    unsetenv(CONFIG_PATH_ENV_VARIABLE);
}

TEST_CASE("a missing requested config file is an error") {
    SystemConfig config;
    std::string error_message;
    CHECK(load_system_config(config, "/nonexistent/bridge.csv", error_message) == 1);
    CHECK(error_message.find("not found") != std::string::npos);
}

TEST_CASE("load_system_config validates what it loads") {
    std::string config_path = write_config_file("invalid", "connection.max_attempts,0\n");

    SystemConfig config;
    std::string error_message;
    CHECK(load_system_config(config, config_path, error_message) == 1);
    CHECK(error_message.find("max_attempts") != std::string::npos);
    std::remove(config_path.c_str());
}

TEST_CASE("status file default matches the health-check script and radio verification can be turned off") {
    SystemConfig defaults;
    CHECK(defaults.status.file_path == "/tmp/meshtastic-bridge-status.json");
    CHECK(defaults.discovery.verify_radios);

    std::string config_path = write_config_file("verify", "discovery.verify_radios,false\n");
    SystemConfig config;
    std::string error_message;
    REQUIRE(load_config_from_csv(config, config_path, error_message));
    CHECK_FALSE(config.discovery.verify_radios);
    std::remove(config_path.c_str());
}
