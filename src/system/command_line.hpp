#ifndef COMMAND_LINE_HPP
#define COMMAND_LINE_HPP

#include "configs/system_config.hpp"
#include <string>
#include <vector>

namespace MeshBridge {
namespace System {

struct CommandLineOptions {
    std::string config_path;       // Empty = MESH_BRIDGE_CONFIG or the default path
    std::string link_a_port;
    std::string link_b_port;
    bool show_help = false;

    bool has_manual_ports() const { return !link_a_port.empty() && !link_b_port.empty(); }
};

// mesh_bridge [port_a port_b] [--config <path>] [--help]
// Throws std::invalid_argument on malformed input.
CommandLineOptions parse_command_line(const std::vector<std::string>& arguments);

std::string usage_text(const std::string& program_name);

// Two positional ports switch the bridge to manual mode
void apply_command_line_ports(Config::SystemConfig& config, const CommandLineOptions& options);

} // namespace System
} // namespace MeshBridge

#endif // COMMAND_LINE_HPP
