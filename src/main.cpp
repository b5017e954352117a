// main.cpp
#include "system/system_manager.hpp"
#include <iostream>
#include <csignal>
#include <atomic>
#include <memory>
#include <string>
#include <vector>

using namespace MeshBridge::System;

// =============================================================================
// ENCAPSULATED SHUTDOWN HANDLER - NO GLOBAL VARIABLES
// =============================================================================
class ShutdownHandler {
private:
    std::atomic<SystemState*> system_state_pointer{nullptr};

public:
    static ShutdownHandler& get_instance() {
        static ShutdownHandler instance;
        return instance;
    }

    void set_system_state(SystemState* state) {
        system_state_pointer.store(state);
    }

    void signal_handler(int signal_number) {
        if (signal_number != SIGINT && signal_number != SIGTERM) {
            return;
        }
        SystemState* state = system_state_pointer.load();
        if (state) {
            state->request_shutdown();
        }
    }

private:
    ShutdownHandler() = default;
    ShutdownHandler(const ShutdownHandler&) = delete;
    ShutdownHandler& operator=(const ShutdownHandler&) = delete;
};

// =============================================================================
// STATIC SIGNAL HANDLER FUNCTION
// =============================================================================
static void signal_handler(int signal_number) {
    ShutdownHandler::get_instance().signal_handler(signal_number);
}

// =============================================================================
// MAIN APPLICATION ENTRY POINT
// =============================================================================

int main(int argc, char* argv[]) {
    std::string program_name = argc > 0 ? argv[0] : "mesh_bridge";

    CommandLineOptions options;
    try {
        std::vector<std::string> arguments;
        for (int argument_index = 1; argument_index < argc; ++argument_index) {
            arguments.push_back(argv[argument_index]);
        }
        options = parse_command_line(arguments);
    } catch (const std::invalid_argument& argument_exception_error) {
        std::cerr << argument_exception_error.what() << "\n" << usage_text(program_name);
        return 2;
    }
    if (options.show_help) {
        std::cout << usage_text(program_name);
        return 0;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    SystemInitializationResult initialization_result;
    try {
        initialization_result = initialize(options);
    } catch (const std::exception& initialization_exception_error) {
        std::cerr << "Fatal error: " << initialization_exception_error.what() << std::endl;
        return 1;
    }

    SystemState& system_state = *initialization_result.system_state;
    ShutdownHandler::get_instance().set_system_state(&system_state);

    SystemThreads thread_handles;
    int exit_code = 0;
    try {
        startup(system_state, thread_handles, initialization_result.logger);
        run(system_state);
    } catch (const std::exception& exception_error) {
        // A shutdown signal during startup is a clean exit
        if (!system_state.is_shutdown_requested()) {
            exit_code = 1;
        }
    }

    shutdown(system_state, thread_handles, initialization_result.logger);
    ShutdownHandler::get_instance().set_system_state(nullptr);
    return exit_code;
}
