#ifndef STATUS_REPORTER_THREAD_HPP
#define STATUS_REPORTER_THREAD_HPP

#include "configs/status_config.hpp"
#include "status/status_reporter.hpp"
#include "utils/time_utils.hpp"
#include <atomic>

namespace MeshBridge {
namespace Threads {

struct StatusReporterThread {
    const Config::StatusConfig& status;
    Status::StatusReporter& status_reporter;
    TimeUtils::InterruptibleSleep sleeper;
    std::atomic<unsigned long>* iteration_counter {nullptr};

    StatusReporterThread(const Config::StatusConfig& status_cfg,
                         Status::StatusReporter& reporter_ref,
                         TimeUtils::InterruptibleSleep sleep_function)
        : status(status_cfg), status_reporter(reporter_ref), sleeper(std::move(sleep_function)) {}

    void set_iteration_counter(std::atomic<unsigned long>& counter) { iteration_counter = &counter; }
    void operator()();
};

} // namespace Threads
} // namespace MeshBridge

#endif // STATUS_REPORTER_THREAD_HPP
