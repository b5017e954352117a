// TimingConfig.hpp
#ifndef TIMING_CONFIG_HPP
#define TIMING_CONFIG_HPP

namespace MeshBridge {
namespace Config {

struct TimingConfig {
    // ========================================================================
    // THREAD POLLING INTERVALS
    // ========================================================================

    int logging_poll_interval_milliseconds = 250;    // Logging thread flush interval
    int main_loop_poll_interval_milliseconds = 1000; // Main thread shutdown wait slice

    // ========================================================================
    // THREAD LIFECYCLE MANAGEMENT
    // ========================================================================

    int shutdown_join_warning_seconds = 5;           // Slow-exit warning for background threads; joins never give up
};

} // namespace Config
} // namespace MeshBridge

#endif // TIMING_CONFIG_HPP
