#ifndef TRACKER_CONFIG_HPP
#define TRACKER_CONFIG_HPP

namespace MeshBridge {
namespace Config {

struct TrackerConfig {
    int max_age_seconds = 600;                       // Dedup window
    int max_messages = 1000;                         // Count bound on tracked records
    int recent_messages_count = 50;                  // Default size of get_recent_messages()
};

} // namespace Config
} // namespace MeshBridge

#endif // TRACKER_CONFIG_HPP
