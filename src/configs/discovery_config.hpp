#ifndef DISCOVERY_CONFIG_HPP
#define DISCOVERY_CONFIG_HPP

namespace MeshBridge {
namespace Config {

struct DiscoveryConfig {
    int wait_for_devices_seconds = 30;               // Max wait for USB serial devices at startup
    int check_interval_seconds = 1;
    int required_device_count = 2;
    bool verify_radios = true;                       // Open each candidate and require a node identity
};

} // namespace Config
} // namespace MeshBridge

#endif // DISCOVERY_CONFIG_HPP
