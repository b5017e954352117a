#ifndef LOGGING_THREAD_LOGS_HPP
#define LOGGING_THREAD_LOGS_HPP

#include <string>

namespace MeshBridge {
namespace Logging {

class LoggingThreadLogs {
public:
    static void log_thread_exception(const std::string& error_message);
    static void log_log_file_open_failure(const std::string& file_path);
    static void log_loop_iteration_exception(const std::string& error_message);
};

} // namespace Logging
} // namespace MeshBridge

#endif // LOGGING_THREAD_LOGS_HPP
