#ifndef CONNECTION_CONFIG_HPP
#define CONNECTION_CONFIG_HPP

namespace MeshBridge {
namespace Config {

struct ConnectionConfig {
    int max_attempts = 5;                            // Open attempts per connect()/reconnect()
    int initial_retry_delay_seconds = 2;             // Delay before the first retry
    double backoff_multiplier = 2.0;                 // Delay growth per subsequent retry
};

} // namespace Config
} // namespace MeshBridge

#endif // CONNECTION_CONFIG_HPP
