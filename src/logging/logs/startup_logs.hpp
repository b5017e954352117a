#ifndef STARTUP_LOGS_HPP
#define STARTUP_LOGS_HPP

#include "configs/system_config.hpp"
#include <string>
#include <vector>

namespace MeshBridge {
namespace Logging {

class StartupLogs {
public:
    static void log_application_header(const std::string& config_path);
    static void log_configuration_summary(const Config::SystemConfig& config);
    static void log_device_wait(int found_count, int required_count, int waited_seconds);
    static void log_devices_found(const std::vector<std::string>& device_paths);
    static void log_port_assignment(const std::string& link_label, const std::string& port, bool auto_detected);
    static void log_port_verified(const std::string& port, const std::string& node_id);
    static void log_port_rejected(const std::string& port, const std::string& reason);
};

} // namespace Logging
} // namespace MeshBridge

#endif // STARTUP_LOGS_HPP
