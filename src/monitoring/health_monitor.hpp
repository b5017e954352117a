#ifndef HEALTH_MONITOR_HPP
#define HEALTH_MONITOR_HPP

#include "bridge/connection_manager.hpp"
#include "configs/health_config.hpp"
#include "utils/time_utils.hpp"
#include <vector>

namespace MeshBridge {
namespace Monitoring {

enum class HealthCheckOutcome {
    HEALTHY,
    PROBE_FAILED,          // Below threshold, no action taken
    RECOVERY_IN_PROGRESS,  // Another reconnect owns the link, probe skipped
    RECOVERED,             // Escalated and the reconnect succeeded
    RECOVERY_FAILED,       // Escalated and the reconnect gave up
    ESCALATION_ABORTED     // Shutdown arrived during the post-reboot settle wait
};

/**
 * Per-link liveness probing with staged recovery.
 *
 * Each cycle probes every link. A passing probe clears the failure count.
 * Failures below the threshold are only logged; at the threshold the radio is
 * asked to reboot (skipped when unsupported or failing), then the link is
 * reconnected and the count starts again from zero whatever the outcome.
 */
class HealthMonitor {
public:
    HealthMonitor(const std::vector<Bridge::ConnectionManager*>& connection_managers,
                  const Config::HealthConfig& health_config, TimeUtils::InterruptibleSleep sleeper);

    void set_recovery_failure_handler(Bridge::RecoveryFailureHandler handler);

    void run_health_check_cycle();
    HealthCheckOutcome check_link(Bridge::ConnectionManager& connection_manager);

private:
    HealthCheckOutcome escalate(Bridge::ConnectionManager& connection_manager, int consecutive_failures);

    std::vector<Bridge::ConnectionManager*> connection_managers;
    const Config::HealthConfig& config;
    TimeUtils::InterruptibleSleep sleeper;
    Bridge::RecoveryFailureHandler recovery_failure_handler;
};

} // namespace Monitoring
} // namespace MeshBridge

#endif // HEALTH_MONITOR_HPP
