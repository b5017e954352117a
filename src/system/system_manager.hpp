#ifndef SYSTEM_MANAGER_HPP
#define SYSTEM_MANAGER_HPP

#include <memory>
#include "system/command_line.hpp"
#include "system/system_modules.hpp"
#include "system/system_state.hpp"
#include "system/system_threads.hpp"
#include "link/radio_link_interface.hpp"
#include "logging/logger/async_logger.hpp"

namespace MeshBridge {
namespace System {

struct SystemInitializationResult {
    std::unique_ptr<SystemState> system_state;
    std::shared_ptr<MeshBridge::Logging::AsyncLogger> logger;

    SystemInitializationResult() = default;
    SystemInitializationResult(SystemInitializationResult&&) = default;
    SystemInitializationResult& operator=(SystemInitializationResult&&) = default;

    SystemInitializationResult(const SystemInitializationResult&) = delete;
    SystemInitializationResult& operator=(const SystemInitializationResult&) = delete;
};

// Configuration, logging foundation and system state. Throws on a config error.
SystemInitializationResult initialize(const CommandLineOptions& options);

// Logger thread, port resolution, link connection and worker threads.
// Throws on a fatal startup error after logging it and raising an alert.
void startup(SystemState& system_state, SystemThreads& system_threads,
             std::shared_ptr<MeshBridge::Logging::AsyncLogger> logger);

void run(SystemState& system_state);

// Safe after a partial startup; every step tolerates missing modules
void shutdown(SystemState& system_state, SystemThreads& system_threads,
              std::shared_ptr<MeshBridge::Logging::AsyncLogger> logger);

// Fills empty link ports from discovered devices when auto-detect is on. With
// discovery.verify_radios set, a candidate is only taken once a link from
// verification_factory opens on it and reports a node identity.
// Throws std::runtime_error when fewer radios than needed are present.
void resolve_link_ports(Config::LinkConfig& links, const Config::DiscoveryConfig& discovery,
                        const TimeUtils::InterruptibleSleep& sleeper,
                        const Link::RadioLinkFactory& verification_factory);

} // namespace System
} // namespace MeshBridge

#endif // SYSTEM_MANAGER_HPP
