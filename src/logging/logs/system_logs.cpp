#include "system_logs.hpp"
#include "logging/logger/async_logger.hpp"
#include "utils/time_utils.hpp"

namespace MeshBridge {
namespace Logging {

void SystemLogs::log_system_startup_error(const std::string& error_message) {
    log_message(std::string("ERROR: System startup error: ") + error_message, "");
}

void SystemLogs::log_system_shutdown_error(const std::string& error_message) {
    log_message(std::string("ERROR: System shutdown error: ") + error_message, "");
}

void SystemLogs::log_system_warning(const std::string& warning_message) {
    log_message(std::string("WARNING: ") + warning_message, "");
}

void SystemLogs::log_fatal_error(const std::string& error_message) {
    log_message(std::string("FATAL: ") + error_message, "");
}

void SystemLogs::log_thread_startup_error(const std::string& error_message) {
    log_message(std::string("ERROR: Error starting threads: ") + error_message, "");
}

void SystemLogs::log_threads_started(int expected_count, int actual_count) {
    if (actual_count == expected_count) {
        log_message("THREAD_STARTUP: All " + std::to_string(expected_count) + " threads started successfully", "");
    } else {
        log_message("THREAD_STARTUP: WARNING - Only " + std::to_string(actual_count) +
                    " of " + std::to_string(expected_count) + " threads started", "");
    }
}

void SystemLogs::log_thread_join_slow(const std::string& thread_name) {
    log_message("WARNING: Thread " + thread_name + " is slow to stop, still waiting", "");
}

void SystemLogs::log_main_loop_error(const std::string& error_message) {
    log_message(std::string("ERROR: Error in main loop: ") + error_message, "");
}

void SystemLogs::log_startup_complete() {
    log_message("SYSTEM_STARTUP: Bridge running, forwarding messages between both radios", "");
}

void SystemLogs::log_shutdown_requested(const std::string& reason) {
    log_message("SYSTEM_SHUTDOWN: Shutdown requested (" + reason + ")", "");
}

void SystemLogs::log_shutdown_complete(long uptime_seconds) {
    log_message("SYSTEM_SHUTDOWN: Bridge stopped after " + TimeUtils::format_duration_seconds(uptime_seconds), "");
}

} // namespace Logging
} // namespace MeshBridge
