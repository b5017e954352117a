#ifndef LOGGING_THREAD_HPP
#define LOGGING_THREAD_HPP

#include <string>
#include <atomic>
#include <memory>
#include "logging/logger/async_logger.hpp"
#include "configs/system_config.hpp"

namespace MeshBridge {
namespace Threads {

class LoggingThread {
public:
    LoggingThread(std::shared_ptr<MeshBridge::Logging::AsyncLogger> logger,
                  std::atomic<unsigned long>& iterations,
                  const MeshBridge::Config::SystemConfig& system_config)
        : logger_ptr(logger), logger_iterations(&iterations), config(system_config) {}

    void operator()();

private:
    std::shared_ptr<MeshBridge::Logging::AsyncLogger> logger_ptr;
    std::atomic<unsigned long>* logger_iterations;
    const MeshBridge::Config::SystemConfig& config;

    void execute_logging_processing_loop();
};

} // namespace Threads
} // namespace MeshBridge

#endif // LOGGING_THREAD_HPP
