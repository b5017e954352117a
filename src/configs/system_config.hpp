#ifndef SYSTEM_CONFIG_HPP
#define SYSTEM_CONFIG_HPP

#include "link_config.hpp"
#include "tracker_config.hpp"
#include "connection_config.hpp"
#include "health_config.hpp"
#include "status_config.hpp"
#include "discovery_config.hpp"
#include "logging_config.hpp"
#include "timing_config.hpp"

namespace MeshBridge {
namespace Config {

/**
 * Main bridge configuration.
 * Every section carries working defaults; the CSV loader overrides individual keys.
 */
struct SystemConfig {
    SystemConfig() {}

    LinkConfig links;                  // Ports, labels and serial settings for both links
    TrackerConfig tracker;             // Dedup window bounds
    ConnectionConfig connection;       // Retry and backoff policy
    HealthConfig health;               // Probe interval and escalation threshold
    StatusConfig status;               // Status snapshot sinks
    AlertConfig alerts;                // Failure alert webhook
    DiscoveryConfig discovery;         // USB device wait at startup
    LoggingConfig logging;             // Log file placement
    TimingConfig timing;               // Thread polling and shutdown timing
};

} // namespace Config
} // namespace MeshBridge

#endif // SYSTEM_CONFIG_HPP
