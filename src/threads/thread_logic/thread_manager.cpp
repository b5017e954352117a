#include "thread_manager.hpp"
#include "logging/logs/system_logs.hpp"

using MeshBridge::Logging::SystemLogs;

namespace MeshBridge {
namespace Threads {

namespace {
    constexpr int JOIN_POLL_INTERVAL_MILLISECONDS = 50;
}

bool Manager::start_threads(ThreadManagerState& manager_state, const std::vector<ThreadDefinition>& thread_definitions,
                            MeshBridge::Logging::LoggingContext& logging_context) {
    try {
        for (const ThreadDefinition& thread_definition : thread_definitions) {
            std::shared_ptr<std::atomic<bool>> finished_flag = std::make_shared<std::atomic<bool>>(false);
            // Capture thread_definition by value to avoid dangling reference
            manager_state.active_threads.push_back(std::thread([thread_definition, finished_flag, &logging_context]() {
                MeshBridge::Logging::set_thread_logging_context(logging_context);
                try {
                    thread_definition.thread_function();
                } catch (const std::exception& exception_error) {
                    SystemLogs::log_thread_startup_error(thread_definition.name + ": " + exception_error.what());
                } catch (...) {
                    SystemLogs::log_thread_startup_error(thread_definition.name + ": unknown exception");
                }
                finished_flag->store(true);
            }));
            manager_state.thread_names.push_back(thread_definition.name);
            manager_state.finished_flags.push_back(finished_flag);
        }
        SystemLogs::log_threads_started(static_cast<int>(thread_definitions.size()),
                                        static_cast<int>(manager_state.active_threads.size()));
        return true;
    } catch (const std::exception& exception_error) {
        SystemLogs::log_thread_startup_error(std::string("Exception starting threads: ") + exception_error.what());
        return false;
    }
}

bool Manager::shutdown_threads(ThreadManagerState& manager_state, std::chrono::milliseconds slow_join_warning) {
    std::chrono::steady_clock::time_point warning_deadline = std::chrono::steady_clock::now() + slow_join_warning;
    bool all_threads_stopped_in_time = true;

    for (std::size_t thread_index = 0; thread_index < manager_state.active_threads.size(); ++thread_index) {
        std::thread& thread_instance = manager_state.active_threads[thread_index];
        if (!thread_instance.joinable()) {
            continue;
        }
        while (!manager_state.finished_flags[thread_index]->load() && std::chrono::steady_clock::now() < warning_deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(JOIN_POLL_INTERVAL_MILLISECONDS));
        }
        if (!manager_state.finished_flags[thread_index]->load()) {
            SystemLogs::log_thread_join_slow(manager_state.thread_names[thread_index]);
            all_threads_stopped_in_time = false;
        }
        // Workers reference SystemState, so they are always joined
        thread_instance.join();
    }
    manager_state.clear_all_data();
    return all_threads_stopped_in_time;
}

} // namespace Threads
} // namespace MeshBridge
