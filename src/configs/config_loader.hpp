#ifndef CONFIG_LOADER_HPP
#define CONFIG_LOADER_HPP

#include "system_config.hpp"
#include <string>

namespace MeshBridge {
namespace Config {

constexpr const char* DEFAULT_CONFIG_PATH = "config/bridge_config.csv";
constexpr const char* CONFIG_PATH_ENV_VARIABLE = "MESH_BRIDGE_CONFIG";

// Load key,value CSV into SystemConfig. Unknown keys are ignored. Returns false if the
// file cannot be opened or a value fails to parse (error_message names the key).
bool load_config_from_csv(SystemConfig& cfg, const std::string& csv_path, std::string& error_message);

// Validate system configuration. Returns true if valid, false otherwise with error message.
bool validate_config(const SystemConfig& config, std::string& error_message);

// Resolve the config path: explicit argument, then MESH_BRIDGE_CONFIG, then the default.
std::string resolve_config_path(const std::string& explicit_path);

// Load and validate. A missing default file is not an error (defaults apply);
// a missing explicitly requested file is. Returns 0 on success, 1 on failure.
int load_system_config(SystemConfig& config, const std::string& explicit_path, std::string& error_message);

} // namespace Config
} // namespace MeshBridge

#endif // CONFIG_LOADER_HPP
