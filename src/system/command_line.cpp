#include "command_line.hpp"
#include <stdexcept>

namespace MeshBridge {
namespace System {

CommandLineOptions parse_command_line(const std::vector<std::string>& arguments) {
    CommandLineOptions options;
    std::vector<std::string> positional_arguments;

    for (std::size_t argument_index = 0; argument_index < arguments.size(); ++argument_index) {
        const std::string& argument = arguments[argument_index];
        if (argument == "--help" || argument == "-h") {
            options.show_help = true;
        } else if (argument == "--config" || argument == "-c") {
            if (argument_index + 1 >= arguments.size()) {
                throw std::invalid_argument(argument + " requires a path");
            }
            options.config_path = arguments[++argument_index];
        } else if (argument.rfind("--config=", 0) == 0) {
            options.config_path = argument.substr(9);
            if (options.config_path.empty()) {
                throw std::invalid_argument("--config requires a path");
            }
        } else if (!argument.empty() && argument[0] == '-') {
            throw std::invalid_argument("Unknown option: " + argument);
        } else {
            positional_arguments.push_back(argument);
        }
    }

    if (positional_arguments.size() == 2) {
        options.link_a_port = positional_arguments[0];
        options.link_b_port = positional_arguments[1];
    } else if (!positional_arguments.empty()) {
        throw std::invalid_argument("Expected both ports or none, got " + std::to_string(positional_arguments.size()));
    }
    return options;
}

std::string usage_text(const std::string& program_name) {
    return "Usage: " + program_name + " [port_a port_b] [--config <path>]\n"
           "  port_a port_b     Serial ports of the two radios (manual mode, auto-detect off)\n"
           "  --config <path>   Config CSV (default: $MESH_BRIDGE_CONFIG or config/bridge_config.csv)\n"
           "  --help            Show this message\n";
}

void apply_command_line_ports(Config::SystemConfig& config, const CommandLineOptions& options) {
    if (!options.has_manual_ports()) {
        return;
    }
    config.links.link_a_port = options.link_a_port;
    config.links.link_b_port = options.link_b_port;
    config.links.auto_detect = false;
}

} // namespace System
} // namespace MeshBridge
