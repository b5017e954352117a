#ifndef ASYNC_LOGGER_HPP
#define ASYNC_LOGGER_HPP

#include <string>
#include <mutex>
#include <condition_variable>
#include <deque>
#include <atomic>
#include <chrono>
#include <thread>
#include <memory>
#include <unordered_map>
#include <vector>
#include <fstream>
#include "configs/system_config.hpp"

namespace MeshBridge {
namespace Logging {

constexpr std::size_t LOG_TAG_WIDTH = 6;

/**
 * Line queue between every producer thread and the single logging thread.
 * Producers enqueue fully formatted lines; the logging thread drains them in
 * batches and writes each batch to the console and the run log file.
 */
class AsyncLogger {
public:
    std::mutex mtx;
    std::condition_variable cv;
    std::atomic<bool> running{false};

    explicit AsyncLogger(const std::string& log_file_path) : file_path(log_file_path) {}

    const std::string& get_file_path() const { return file_path; }
    void enqueue(const std::string& formatted_line);

    // Wakes the logging thread; lines already queued are still drained
    void stop();

    // Non-blocking drain into message_buffer
    void collect_all_available_messages(std::vector<std::string>& message_buffer);

    // Blocks up to timeout for the first line, then drains the queue
    void wait_for_messages(std::vector<std::string>& message_buffer, std::chrono::milliseconds timeout);

    // Writes the batch and clears it
    void flush_message_buffer(std::vector<std::string>& message_buffer, std::ofstream& log_file);

private:
    void drain_locked(std::vector<std::string>& message_buffer);

    std::string file_path;
    std::deque<std::string> pending_lines;
};

struct LoggingContext {
    std::shared_ptr<AsyncLogger> async_logger;
    std::mutex console_mutex;
    std::atomic<bool> console_output_enabled{true};
    std::atomic<bool> debug_enabled{false};
    std::string run_folder;

    // "MAIN  " for threads that never set a tag
    std::string get_thread_tag() const;
    void set_thread_tag(const std::string& tag_value);
    void clear_thread_tag();

private:
    mutable std::mutex thread_tag_mutex;
    std::unordered_map<std::thread::id, std::string> thread_tags;
};

// Fixed-width tag shown after the timestamp of every line from the calling thread
void set_log_thread_tag(const std::string& thread_tag_value);
void clear_log_thread_tag();

// Never throws. log_file_path is only used when no async logger is attached.
void log_message(const std::string& message, const std::string& log_file_path);

// Emitted only when debug logging is enabled in the context
void log_debug_message(const std::string& message);

// <dir>/<stem>_<DD-HH-MM><ext>
std::string generate_timestamped_log_filename(const std::string& log_directory, const std::string& log_file_name);

void shutdown_global_logger(AsyncLogger& logger);

// Creates the run folder and the async logger, and attaches it to the current context
std::shared_ptr<AsyncLogger> initialize_bridge_logging(const MeshBridge::Config::SystemConfig& config);

// Throws std::runtime_error when no context was installed
LoggingContext* get_logging_context();

// Installs the context for every thread that has no thread-local override
void set_logging_context(LoggingContext& context);

// Overrides the context for the calling thread only
void set_thread_logging_context(LoggingContext& context);

} // namespace Logging
} // namespace MeshBridge

#endif // ASYNC_LOGGER_HPP
