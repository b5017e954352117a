#include "system_manager.hpp"
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>
#include "configs/config_loader.hpp"
#include "link/device_discovery.hpp"
#include "link/serial_radio_link.hpp"
#include "logging/logs/health_logs.hpp"
#include "logging/logs/startup_logs.hpp"
#include "logging/logs/status_logs.hpp"
#include "logging/logs/system_logs.hpp"
#include "threads/system_threads/logging_thread.hpp"
#include "threads/thread_logic/thread_manager.hpp"
#include "utils/http_utils.hpp"
#include "utils/time_utils.hpp"

using namespace MeshBridge::Logging;
using namespace MeshBridge::Threads;

namespace MeshBridge {
namespace System {

namespace {

constexpr const char* LINK_A_READER_TAG = "LINK-A";
constexpr const char* LINK_B_READER_TAG = "LINK-B";

void raise_failure_alert(SystemState& state, const std::string& alert_message) {
    if (state.bridge_modules && state.bridge_modules->alert_notifier) {
        state.bridge_modules->alert_notifier->send_alert(Status::ALERT_STATUS_FAILED, alert_message);
    }
}

Link::RadioLinkFactory make_serial_link_factory(SystemState& state, const std::string& reader_thread_tag) {
    const Config::LinkConfig& link_config = state.config.links;
    TimeUtils::InterruptibleSleep settle_sleeper = state.make_sleeper();
    return [&link_config, reader_thread_tag, settle_sleeper]() -> Link::RadioLinkPtr {
        return Link::RadioLinkPtr(new Link::SerialRadioLink(link_config, reader_thread_tag, settle_sleeper));
    };
}

void create_bridge_modules(SystemState& state, SystemThreads& threads) {
    SystemModules& modules = *state.bridge_modules;
    const Config::SystemConfig& config = state.config;

    Link::RadioLinkFactory link_a_factory = make_serial_link_factory(state, LINK_A_READER_TAG);
    Link::RadioLinkFactory link_b_factory = make_serial_link_factory(state, LINK_B_READER_TAG);

    modules.forwarding_engine = std::make_unique<Bridge::ForwardingEngine>(
        config, config.links.link_a_port, config.links.link_b_port,
        link_a_factory, link_b_factory, state.make_sleeper());

    Status::AlertNotifier* alert_notifier_pointer = modules.alert_notifier.get();
    Bridge::RecoveryFailureHandler recovery_failure_handler =
        [alert_notifier_pointer](const std::string& link_label, const std::string& error_message) {
            alert_notifier_pointer->send_alert(Status::ALERT_STATUS_DEGRADED,
                                               "Link " + link_label + " could not be recovered: " + error_message);
        };
    modules.forwarding_engine->set_recovery_failure_handler(recovery_failure_handler);

    if (config.health.enabled) {
        modules.health_monitor = std::make_unique<Monitoring::HealthMonitor>(
            modules.forwarding_engine->get_connection_managers(), config.health, state.make_sleeper());
        modules.health_monitor->set_recovery_failure_handler(recovery_failure_handler);
        modules.health_thread = std::make_unique<HealthMonitorThread>(
            config.health, *modules.health_monitor, state.make_sleeper());
        modules.health_thread->set_iteration_counter(threads.health_iterations);
    } else {
        HealthLogs::log_monitor_disabled();
    }

    modules.status_reporter = std::make_unique<Status::StatusReporter>(*modules.forwarding_engine);
    Status::add_configured_sinks(*modules.status_reporter, config.status);
    modules.status_thread = std::make_unique<StatusReporterThread>(
        config.status, *modules.status_reporter, state.make_sleeper());
    modules.status_thread->set_iteration_counter(threads.status_iterations);
}

std::vector<ThreadDefinition> build_thread_definitions(SystemState& state) {
    std::vector<ThreadDefinition> thread_definitions;
    SystemModules& modules = *state.bridge_modules;

    if (modules.health_thread) {
        HealthMonitorThread* health_thread_pointer = modules.health_thread.get();
        thread_definitions.emplace_back("health_monitor", [health_thread_pointer]() { (*health_thread_pointer)(); });
    }
    if (modules.status_thread) {
        StatusReporterThread* status_thread_pointer = modules.status_thread.get();
        thread_definitions.emplace_back("status_reporter", [status_thread_pointer]() { (*status_thread_pointer)(); });
    }
    return thread_definitions;
}

void publish_final_status(SystemState& state) {
    if (!state.bridge_modules || !state.bridge_modules->status_reporter) {
        return;
    }
    try {
        state.bridge_modules->status_reporter->publish(false);
    } catch (const std::exception& publish_exception_error) {
        StatusLogs::log_reporter_error(publish_exception_error.what());
    }
}

} // namespace

SystemInitializationResult initialize(const CommandLineOptions& options) {
    SystemInitializationResult initialization_result;

    try {
        // Minimal logging context first; the config loader may log
        std::shared_ptr<LoggingContext> early_logging_context = std::make_shared<LoggingContext>();
        set_logging_context(*early_logging_context);

        Config::SystemConfig initial_config;
        std::string config_error_message;
        int config_load_result = Config::load_system_config(initial_config, options.config_path, config_error_message);
        if (config_load_result != 0) {
            SystemLogs::log_fatal_error("Configuration error: " + config_error_message);
            throw std::runtime_error("System initialization failed: " + config_error_message);
        }
        apply_command_line_ports(initial_config, options);

        initialization_result.system_state = std::make_unique<SystemState>(initial_config);
        initialization_result.system_state->config_path = Config::resolve_config_path(options.config_path);
        initialization_result.system_state->logging_context = early_logging_context;
        initialization_result.system_state->bridge_modules = std::make_unique<SystemModules>();

        initialization_result.logger = initialize_bridge_logging(initialization_result.system_state->config);
    } catch (const std::exception& initialization_exception_error) {
        SystemLogs::log_fatal_error(std::string("System initialization exception: ") + initialization_exception_error.what());
        throw;
    }

    return initialization_result;
}

void resolve_link_ports(Config::LinkConfig& links, const Config::DiscoveryConfig& discovery,
                        const TimeUtils::InterruptibleSleep& sleeper,
                        const Link::RadioLinkFactory& verification_factory) {
    bool link_a_missing = links.link_a_port.empty();
    bool link_b_missing = links.link_b_port.empty();

    if (!link_a_missing && !link_b_missing) {
        StartupLogs::log_port_assignment(links.link_a_label, links.link_a_port, false);
        StartupLogs::log_port_assignment(links.link_b_label, links.link_b_port, false);
        return;
    }
    if (!links.auto_detect) {
        throw std::runtime_error("Link ports are not configured and auto-detect is disabled");
    }

    std::vector<std::string> discovered_ports = Link::wait_for_devices(
        discovery.required_device_count, discovery.wait_for_devices_seconds,
        discovery.check_interval_seconds, sleeper);
    StartupLogs::log_devices_found(discovered_ports);

    std::vector<std::string> claimed_ports;
    if (!link_a_missing) {
        claimed_ports.push_back(links.link_a_port);
    }
    if (!link_b_missing) {
        claimed_ports.push_back(links.link_b_port);
    }

    std::size_t needed_count = (link_a_missing ? 1 : 0) + (link_b_missing ? 1 : 0);
    std::vector<std::string> selected_ports;
    if (discovery.verify_radios && verification_factory) {
        selected_ports = Link::select_verified_ports(discovered_ports, claimed_ports, needed_count, verification_factory);
    } else {
        selected_ports = Link::select_unclaimed_ports(discovered_ports, claimed_ports, needed_count);
    }
    if (selected_ports.size() < needed_count) {
        throw std::runtime_error("Found only " + std::to_string(claimed_ports.size() + selected_ports.size()) +
                                 " radio(s) among " + std::to_string(discovered_ports.size()) + " serial device(s), need 2");
    }

    std::size_t selected_index = 0;
    if (link_a_missing) {
        links.link_a_port = selected_ports[selected_index++];
    }
    if (link_b_missing) {
        links.link_b_port = selected_ports[selected_index++];
    }
    StartupLogs::log_port_assignment(links.link_a_label, links.link_a_port, link_a_missing);
    StartupLogs::log_port_assignment(links.link_b_label, links.link_b_port, link_b_missing);
}

void startup(SystemState& system_state, SystemThreads& system_threads,
             std::shared_ptr<MeshBridge::Logging::AsyncLogger> logger) {
    system_threads.logger_thread = std::thread(LoggingThread(logger, system_threads.logger_iterations, system_state.config));

    StartupLogs::log_application_header(system_state.config_path);
    StartupLogs::log_configuration_summary(system_state.config);

    HttpUtils::initialize_http_layer();
    system_state.bridge_modules->alert_notifier = std::make_unique<Status::AlertNotifier>(system_state.config.alerts);

    try {
        resolve_link_ports(system_state.config.links, system_state.config.discovery, system_state.make_sleeper(),
                           make_serial_link_factory(system_state, "VERIFY"));
        create_bridge_modules(system_state, system_threads);
        system_state.bridge_modules->forwarding_engine->start();

        std::vector<ThreadDefinition> thread_definitions = build_thread_definitions(system_state);
        bool threads_started = Manager::start_threads(system_state.thread_manager_state, thread_definitions,
                                                      *system_state.logging_context);
        SystemLogs::log_threads_started(static_cast<int>(thread_definitions.size()),
                                        static_cast<int>(system_state.thread_manager_state.active_threads.size()));
        if (!threads_started) {
            throw std::runtime_error("Worker threads failed to start");
        }
    } catch (const std::exception& startup_exception_error) {
        if (system_state.is_shutdown_requested()) {
            SystemLogs::log_system_startup_error(std::string("Startup interrupted by shutdown: ") + startup_exception_error.what());
            throw;
        }
        SystemLogs::log_fatal_error(startup_exception_error.what());
        raise_failure_alert(system_state, std::string("Bridge failed to start: ") + startup_exception_error.what());
        throw;
    }

    SystemLogs::log_startup_complete();
}

void run(SystemState& system_state) {
    std::chrono::milliseconds poll_interval(system_state.config.timing.main_loop_poll_interval_milliseconds);

    while (system_state.running.load() && !system_state.is_shutdown_requested()) {
        try {
            if (system_state.wait_for_shutdown(poll_interval)) {
                SystemLogs::log_shutdown_requested("signal");
                break;
            }
        } catch (const std::exception& main_loop_exception_error) {
            SystemLogs::log_main_loop_error(main_loop_exception_error.what());
        }
    }
}

void shutdown(SystemState& system_state, SystemThreads& system_threads,
              std::shared_ptr<MeshBridge::Logging::AsyncLogger> logger) {
    if (system_state.request_shutdown()) {
        SystemLogs::log_shutdown_requested("exit");
    }

    try {
        // Health reconnects and retry waits must give up before the workers are joined
        if (system_state.bridge_modules && system_state.bridge_modules->forwarding_engine) {
            system_state.bridge_modules->forwarding_engine->begin_shutdown();
        }

        std::chrono::milliseconds slow_join_warning(system_state.config.timing.shutdown_join_warning_seconds * TimeUtils::MILLISECONDS_PER_SECOND);
        if (!Manager::shutdown_threads(system_state.thread_manager_state, slow_join_warning)) {
            SystemLogs::log_system_warning("Some worker threads were slow to exit");
        }

        if (system_state.bridge_modules && system_state.bridge_modules->forwarding_engine) {
            system_state.bridge_modules->forwarding_engine->shutdown();
        }
        publish_final_status(system_state);
    } catch (const std::exception& shutdown_exception_error) {
        SystemLogs::log_system_shutdown_error(shutdown_exception_error.what());
    }

    long uptime_seconds = static_cast<long>(TimeUtils::seconds_since(system_state.start_time));
    SystemLogs::log_shutdown_complete(uptime_seconds);

    HttpUtils::shutdown_http_layer();

    if (logger) {
        shutdown_global_logger(*logger);
    }
    if (system_threads.logger_thread.joinable()) {
        system_threads.logger_thread.join();
    }
}

} // namespace System
} // namespace MeshBridge
