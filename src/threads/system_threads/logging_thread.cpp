/**
 * Logging thread.
 * Drains the async logger queue to the console and the run log file.
 */
#include "logging_thread.hpp"
#include "logging/logs/logging_thread_logs.hpp"
#include <chrono>
#include <fstream>
#include <vector>

using namespace MeshBridge::Threads;
using namespace MeshBridge::Logging;

void LoggingThread::operator()() {
    set_log_thread_tag("LOGGER");
    try {
        execute_logging_processing_loop();
    } catch (const std::exception& exception) {
        LoggingThreadLogs::log_thread_exception(exception.what());
    } catch (...) {
        LoggingThreadLogs::log_thread_exception("Unknown error");
    }
    clear_log_thread_tag();
}

void LoggingThread::execute_logging_processing_loop() {
    std::ofstream log_file(logger_ptr->get_file_path(), std::ios::app);
    if (!log_file.is_open()) {
        LoggingThreadLogs::log_log_file_open_failure(logger_ptr->get_file_path());
    }

    std::chrono::milliseconds poll_interval(config.timing.logging_poll_interval_milliseconds);
    std::vector<std::string> message_buffer;

    while (logger_ptr->running.load()) {
        try {
            logger_ptr->wait_for_messages(message_buffer, poll_interval);
            if (!message_buffer.empty()) {
                logger_ptr->flush_message_buffer(message_buffer, log_file);
                logger_iterations->fetch_add(1);
            }
        } catch (const std::exception& exception) {
            LoggingThreadLogs::log_loop_iteration_exception(exception.what());
            message_buffer.clear();
        } catch (...) {
            LoggingThreadLogs::log_loop_iteration_exception("Unknown error");
            message_buffer.clear();
        }
    }

    // Final flush of anything enqueued before stop()
    logger_ptr->collect_all_available_messages(message_buffer);
    if (!message_buffer.empty()) {
        logger_ptr->flush_message_buffer(message_buffer, log_file);
    }
}
