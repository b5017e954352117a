#ifndef LINK_CONFIG_HPP
#define LINK_CONFIG_HPP

#include <string>

namespace MeshBridge {
namespace Config {

struct LinkConfig {
    // ========================================================================
    // PORT ASSIGNMENT
    // ========================================================================

    std::string link_a_port;                         // Serial port for link A (empty = auto-detect)
    std::string link_b_port;                         // Serial port for link B (empty = auto-detect)
    std::string link_a_label = "radio1";             // Label used in logs, stats and status output
    std::string link_b_label = "radio2";
    bool auto_detect = true;                         // Discover missing ports at startup

    // ========================================================================
    // SERIAL SETTINGS
    // ========================================================================

    int baud_rate = 115200;
    int open_settle_milliseconds = 2000;             // Wait after open for USB CDC reset
    int probe_timeout_milliseconds = 3000;           // Liveness probe reply window
    int identity_timeout_milliseconds = 5000;        // Node identity reply window after open
};

} // namespace Config
} // namespace MeshBridge

#endif // LINK_CONFIG_HPP
