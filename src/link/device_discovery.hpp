#ifndef DEVICE_DISCOVERY_HPP
#define DEVICE_DISCOVERY_HPP

#include "radio_link_interface.hpp"
#include "utils/time_utils.hpp"
#include <string>
#include <vector>

namespace MeshBridge {
namespace Link {

// Entries of a device directory such as /dev/serial/by-id; empty when it is missing.
// Never throws.
std::vector<std::string> list_device_links(const std::string& directory);

// Candidate USB serial radios: /dev/serial/by-id links, /dev/ttyUSB*, /dev/ttyACM*.
// Resolved to device paths, deduplicated and sorted.
std::vector<std::string> discover_serial_ports();

// Polls discover_serial_ports() until required_count ports exist, max_wait_seconds
// pass, or sleeper reports shutdown. Returns whatever was found last.
std::vector<std::string> wait_for_devices(int required_count, int max_wait_seconds, int check_interval_seconds,
                                          const TimeUtils::InterruptibleSleep& sleeper);

// First ports from discovered_ports not already claimed, in order, until count reached.
std::vector<std::string> select_unclaimed_ports(const std::vector<std::string>& discovered_ports,
                                                const std::vector<std::string>& claimed_ports,
                                                std::size_t count);

// Opens a fresh link from link_factory on port and reports whether a radio answered
// with its node identity. The link is always closed again.
bool verify_radio_port(const RadioLinkFactory& link_factory, const std::string& port);

// select_unclaimed_ports, keeping only ports verify_radio_port accepts
std::vector<std::string> select_verified_ports(const std::vector<std::string>& discovered_ports,
                                               const std::vector<std::string>& claimed_ports,
                                               std::size_t count, const RadioLinkFactory& link_factory);

} // namespace Link
} // namespace MeshBridge

#endif // DEVICE_DISCOVERY_HPP
