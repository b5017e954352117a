// LoggingConfig.hpp
#ifndef LOGGING_CONFIG_HPP
#define LOGGING_CONFIG_HPP

#include <string>

namespace MeshBridge {
namespace Config {

struct LoggingConfig {
    std::string log_directory = "runtime_logs";
    std::string log_file = "mesh_bridge.log";
    bool debug_enabled = false;
};

} // namespace Config
} // namespace MeshBridge

#endif // LOGGING_CONFIG_HPP
