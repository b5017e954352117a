#ifndef SYSTEM_LOGS_HPP
#define SYSTEM_LOGS_HPP

#include <string>

namespace MeshBridge {
namespace Logging {

/**
 * Specialized logging for system management operations.
 * Handles all system-level logging in a consistent format.
 */
class SystemLogs {
public:
    // System startup and shutdown
    static void log_system_startup_error(const std::string& error_message);
    static void log_system_shutdown_error(const std::string& error_message);
    static void log_system_warning(const std::string& warning_message);
    static void log_fatal_error(const std::string& error_message);

    // Thread management
    static void log_thread_startup_error(const std::string& error_message);
    static void log_threads_started(int expected_count, int actual_count);
    static void log_thread_join_slow(const std::string& thread_name);
    static void log_main_loop_error(const std::string& error_message);

    // Lifecycle events
    static void log_startup_complete();
    static void log_shutdown_requested(const std::string& reason);
    static void log_shutdown_complete(long uptime_seconds);
};

} // namespace Logging
} // namespace MeshBridge

#endif // SYSTEM_LOGS_HPP
