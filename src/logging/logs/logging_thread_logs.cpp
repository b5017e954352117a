#include "logging_thread_logs.hpp"
#include <iostream>

namespace MeshBridge {
namespace Logging {

// The logging thread cannot log through itself, so these go straight to stderr
void LoggingThreadLogs::log_thread_exception(const std::string& error_message) {
    std::cerr << "LoggingThread exception: " << error_message << std::endl;
}

void LoggingThreadLogs::log_log_file_open_failure(const std::string& file_path) {
    std::cerr << "LoggingThread could not open log file " << file_path << ", console only" << std::endl;
}

void LoggingThreadLogs::log_loop_iteration_exception(const std::string& error_message) {
    std::cerr << "LoggingThread loop iteration exception: " << error_message << std::endl;
}

} // namespace Logging
} // namespace MeshBridge
