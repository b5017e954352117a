#ifndef STATUS_REPORTER_HPP
#define STATUS_REPORTER_HPP

#include "status_sinks.hpp"
#include "configs/status_config.hpp"
#include <vector>

namespace MeshBridge {
namespace Status {

/**
 * Builds a snapshot from the engine and hands it to every configured sink.
 * One failing sink never stops the others.
 */
class StatusReporter {
public:
    explicit StatusReporter(Bridge::ForwardingEngine& forwarding_engine) : engine(forwarding_engine) {}

    void add_sink(StatusSinkPtr sink);
    std::size_t get_sink_count() const { return sinks.size(); }

    // Returns the number of sinks that accepted the snapshot
    std::size_t publish(bool running);

private:
    Bridge::ForwardingEngine& engine;
    std::vector<StatusSinkPtr> sinks;
};

// File, webhook and log sinks as enabled in the status section
void add_configured_sinks(StatusReporter& status_reporter, const Config::StatusConfig& status_config);

} // namespace Status
} // namespace MeshBridge

#endif // STATUS_REPORTER_HPP
