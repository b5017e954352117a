#ifndef STATUS_CONFIG_HPP
#define STATUS_CONFIG_HPP

#include <string>

namespace MeshBridge {
namespace Config {

struct StatusConfig {
    int report_interval_seconds = 30;
    std::string file_path = "/tmp/meshtastic-bridge-status.json";   // Empty disables the file sink
    std::string webhook_url;                                  // Empty disables the webhook sink
    int webhook_timeout_seconds = 10;
    bool log_summary = true;                                  // One summary line per report
};

struct AlertConfig {
    std::string webhook_url;                         // Empty = log-only alerts
    int timeout_seconds = 10;
    std::string service_name = "mesh-bridge";
};

} // namespace Config
} // namespace MeshBridge

#endif // STATUS_CONFIG_HPP
