#include "async_logger.hpp"
#include "utils/time_utils.hpp"
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <unistd.h>

namespace fs = std::filesystem;

namespace MeshBridge {
namespace Logging {

namespace {

std::atomic<LoggingContext*> global_logging_context_pointer{nullptr};
thread_local LoggingContext* thread_local_logging_context_pointer = nullptr;

void write_to_stderr(const std::string& error_message) {
    std::cerr << error_message << std::endl;
}

std::string format_local_time(const char* time_format) {
    std::time_t now = std::time(nullptr);
    std::tm local_time {};
    localtime_r(&now, &local_time);
    std::ostringstream time_stream;
    time_stream << std::put_time(&local_time, time_format);
    return time_stream.str();
}

// Error lines go to stderr so a supervisor journal can filter on them
bool is_error_line(const std::string& message) {
    return message.rfind("ERROR:", 0) == 0 || message.rfind("FATAL:", 0) == 0;
}

void write_console_line(LoggingContext& context, const std::string& log_line, bool error_line) {
    if (!context.console_output_enabled.load()) {
        return;
    }
    std::lock_guard<std::mutex> console_lock(context.console_mutex);
    (error_line ? std::cerr : std::cout) << log_line << std::flush;
}

// <log_directory>/run_DD-HH-MM_<pid>; a supervisor restart inside the same minute gets its own folder
std::string create_unique_run_folder(const std::string& log_directory) {
    fs::path run_folder = fs::path(log_directory) /
        ("run_" + format_local_time(TimeUtils::LOG_FILENAME) + "_" + std::to_string(::getpid()));

    std::error_code create_error;
    fs::create_directories(run_folder, create_error);
    if (create_error) {
        throw std::runtime_error("Failed to create run folder " + run_folder.string() + ": " + create_error.message());
    }
    return run_folder.string();
}

} // namespace

std::string LoggingContext::get_thread_tag() const {
    std::lock_guard<std::mutex> thread_tag_lock(thread_tag_mutex);
    std::unordered_map<std::thread::id, std::string>::const_iterator tag_iterator = thread_tags.find(std::this_thread::get_id());
    return tag_iterator != thread_tags.end() ? tag_iterator->second : std::string("MAIN  ");
}

void LoggingContext::set_thread_tag(const std::string& tag_value) {
    std::string padded_tag = tag_value.substr(0, LOG_TAG_WIDTH);
    padded_tag.resize(LOG_TAG_WIDTH, ' ');
    std::lock_guard<std::mutex> thread_tag_lock(thread_tag_mutex);
    thread_tags[std::this_thread::get_id()] = padded_tag;
}

void LoggingContext::clear_thread_tag() {
    std::lock_guard<std::mutex> thread_tag_lock(thread_tag_mutex);
    thread_tags.erase(std::this_thread::get_id());
}

LoggingContext* get_logging_context() {
    LoggingContext* context_pointer = thread_local_logging_context_pointer;
    if (!context_pointer) {
        context_pointer = global_logging_context_pointer.load();
    }
    if (!context_pointer) {
        throw std::runtime_error("Logging context not initialized - call set_logging_context first");
    }
    return context_pointer;
}

void set_logging_context(LoggingContext& context) {
    global_logging_context_pointer.store(&context);
}

void set_thread_logging_context(LoggingContext& context) {
    thread_local_logging_context_pointer = &context;
}

void set_log_thread_tag(const std::string& thread_tag_value) {
    get_logging_context()->set_thread_tag(thread_tag_value);
}

void clear_log_thread_tag() {
    get_logging_context()->clear_thread_tag();
}

void log_message(const std::string& message, const std::string& log_file_path) {
    try {
        LoggingContext& context = *get_logging_context();
        std::string log_line = TimeUtils::get_current_human_readable_time() + " [" + context.get_thread_tag() + "]   " + message + "\n";

        std::shared_ptr<AsyncLogger> async_logger = context.async_logger;
        if (async_logger && async_logger->running.load()) {
            async_logger->enqueue(log_line);
            return;
        }

        // Before the logging thread starts and after it stops
        write_console_line(context, log_line, is_error_line(message));
        if (!log_file_path.empty()) {
            std::ofstream log_file_stream(log_file_path, std::ios::app);
            if (!log_file_stream.is_open()) {
                write_to_stderr("ERROR: Failed to open log file: " + log_file_path);
                return;
            }
            log_file_stream << log_line;
        }
    } catch (const std::exception& logging_exception_error) {
        write_to_stderr("CRITICAL ERROR: Logging system failure: " + std::string(logging_exception_error.what()));
        write_to_stderr(message);
    }
}

void log_debug_message(const std::string& message) {
    try {
        if (!get_logging_context()->debug_enabled.load()) {
            return;
        }
    } catch (const std::exception& context_exception_error) {
        write_to_stderr("CRITICAL ERROR: Logging system failure: " + std::string(context_exception_error.what()));
        return;
    }
    log_message("DEBUG: " + message, "");
}

std::string generate_timestamped_log_filename(const std::string& log_directory, const std::string& log_file_name) {
    fs::path log_file_path(log_file_name);
    std::string timestamped_name = log_file_path.stem().string() + "_" + format_local_time(TimeUtils::LOG_FILENAME) +
                                   log_file_path.extension().string();
    return (fs::path(log_directory) / timestamped_name).string();
}

void shutdown_global_logger(AsyncLogger& logger) {
    logger.stop();
}

void AsyncLogger::stop() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        running.store(false);
    }
    cv.notify_all();
}

void AsyncLogger::enqueue(const std::string& formatted_line) {
    {
        std::lock_guard<std::mutex> lock(mtx);
        pending_lines.push_back(formatted_line);
    }
    cv.notify_one();
}

void AsyncLogger::drain_locked(std::vector<std::string>& message_buffer) {
    message_buffer.insert(message_buffer.end(),
                          std::make_move_iterator(pending_lines.begin()),
                          std::make_move_iterator(pending_lines.end()));
    pending_lines.clear();
}

void AsyncLogger::collect_all_available_messages(std::vector<std::string>& message_buffer) {
    std::lock_guard<std::mutex> lock(mtx);
    drain_locked(message_buffer);
}

void AsyncLogger::wait_for_messages(std::vector<std::string>& message_buffer, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mtx);
    cv.wait_for(lock, timeout, [this] { return !pending_lines.empty() || !running.load(); });
    drain_locked(message_buffer);
}

void AsyncLogger::flush_message_buffer(std::vector<std::string>& message_buffer, std::ofstream& log_file) {
    LoggingContext& context = *get_logging_context();
    for (const std::string& log_line : message_buffer) {
        write_console_line(context, log_line, log_line.find("]   ERROR:") != std::string::npos ||
                                              log_line.find("]   FATAL:") != std::string::npos);
        if (log_file.is_open()) {
            log_file << log_line;
        }
    }
    if (log_file.is_open()) {
        log_file.flush();
    }
    message_buffer.clear();
}

std::shared_ptr<AsyncLogger> initialize_bridge_logging(const MeshBridge::Config::SystemConfig& config) {
    LoggingContext& context = *get_logging_context();

    context.run_folder = create_unique_run_folder(config.logging.log_directory);
    context.debug_enabled.store(config.logging.debug_enabled);

    std::string log_file_name = fs::path(config.logging.log_file).filename().string();
    std::shared_ptr<AsyncLogger> logger_instance =
        std::make_shared<AsyncLogger>(generate_timestamped_log_filename(context.run_folder, log_file_name));
    logger_instance->running.store(true);

    context.async_logger = logger_instance;
    set_log_thread_tag("MAIN");

    return logger_instance;
}

} // namespace Logging
} // namespace MeshBridge
