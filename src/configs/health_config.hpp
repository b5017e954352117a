#ifndef HEALTH_CONFIG_HPP
#define HEALTH_CONFIG_HPP

namespace MeshBridge {
namespace Config {

struct HealthConfig {
    bool enabled = true;
    int check_interval_seconds = 60;                 // Probe cycle period
    int failure_threshold = 3;                       // Consecutive probe failures before escalation
    int reboot_settle_seconds = 10;                  // Wait after a reboot request before reconnecting
};

} // namespace Config
} // namespace MeshBridge

#endif // HEALTH_CONFIG_HPP
