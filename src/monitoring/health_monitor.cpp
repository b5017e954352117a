#include "health_monitor.hpp"
#include "logging/logs/health_logs.hpp"
#include <stdexcept>

using MeshBridge::Logging::HealthLogs;

namespace MeshBridge {
namespace Monitoring {

HealthMonitor::HealthMonitor(const std::vector<Bridge::ConnectionManager*>& managers,
                             const Config::HealthConfig& health_config, TimeUtils::InterruptibleSleep sleep_function)
    : connection_managers(managers), config(health_config), sleeper(std::move(sleep_function)) {
    if (config.failure_threshold < 1) {
        throw std::runtime_error("health.failure_threshold must be at least 1");
    }
    if (!sleeper) {
        throw std::runtime_error("HealthMonitor requires a sleep function");
    }
}

void HealthMonitor::set_recovery_failure_handler(Bridge::RecoveryFailureHandler handler) {
    recovery_failure_handler = std::move(handler);
}

void HealthMonitor::run_health_check_cycle() {
    for (Bridge::ConnectionManager* connection_manager : connection_managers) {
        try {
            check_link(*connection_manager);
        } catch (const std::exception& cycle_exception_error) {
            HealthLogs::log_cycle_error(connection_manager->get_link_state().get_label() + ": " + cycle_exception_error.what());
        }
    }
}

HealthCheckOutcome HealthMonitor::check_link(Bridge::ConnectionManager& connection_manager) {
    Bridge::LinkState& link_state = connection_manager.get_link_state();
    Bridge::LinkStatus current_status = link_state.get_status();
    if (current_status == Bridge::LinkStatus::RECOVERING || current_status == Bridge::LinkStatus::CONNECTING) {
        return HealthCheckOutcome::RECOVERY_IN_PROGRESS;
    }

    if (connection_manager.probe()) {
        link_state.reset_health_failures();
        link_state.set_status(Bridge::LinkStatus::CONNECTED);
        HealthLogs::log_probe_ok(link_state.get_label());
        return HealthCheckOutcome::HEALTHY;
    }

    int consecutive_failures = link_state.increment_health_failures();
    if (consecutive_failures < config.failure_threshold) {
        HealthLogs::log_probe_failed(link_state.get_label(), consecutive_failures, config.failure_threshold);
        return HealthCheckOutcome::PROBE_FAILED;
    }
    return escalate(connection_manager, consecutive_failures);
}

HealthCheckOutcome HealthMonitor::escalate(Bridge::ConnectionManager& connection_manager, int consecutive_failures) {
    Bridge::LinkState& link_state = connection_manager.get_link_state();
    const std::string& link_label = link_state.get_label();
    HealthLogs::log_escalation_started(link_label, consecutive_failures);

    bool reboot_requested = false;
    try {
        connection_manager.request_reboot();
        reboot_requested = true;
    } catch (const Link::LinkUnsupportedError& unsupported_exception_error) {
        HealthLogs::log_reboot_unavailable(link_label, unsupported_exception_error.what());
    } catch (const Link::LinkCommandError& command_exception_error) {
        HealthLogs::log_reboot_unavailable(link_label, command_exception_error.what());
    }

    if (reboot_requested) {
        HealthLogs::log_reboot_requested(link_label, config.reboot_settle_seconds);
        if (!sleeper(std::chrono::seconds(config.reboot_settle_seconds))) {
            link_state.reset_health_failures();
            return HealthCheckOutcome::ESCALATION_ABORTED;
        }
    }

    HealthCheckOutcome outcome;
    try {
        connection_manager.reconnect("health probe failed " + std::to_string(consecutive_failures) + " times");
        HealthLogs::log_recovery_succeeded(link_label);
        outcome = HealthCheckOutcome::RECOVERED;
    } catch (const Link::LinkConnectionError& reconnect_exception_error) {
        if (connection_manager.is_shutting_down()) {
            HealthLogs::log_escalation_aborted(link_label);
            link_state.reset_health_failures();
            return HealthCheckOutcome::ESCALATION_ABORTED;
        }
        HealthLogs::log_recovery_failed(link_label, reconnect_exception_error.what());
        if (recovery_failure_handler) {
            recovery_failure_handler(link_label, reconnect_exception_error.what());
        }
        outcome = HealthCheckOutcome::RECOVERY_FAILED;
    }

    // Fresh counting cycle whatever happened; a still-dead link re-escalates after
    // another full run of failures
    link_state.reset_health_failures();
    return outcome;
}

} // namespace Monitoring
} // namespace MeshBridge
