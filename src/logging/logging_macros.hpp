#ifndef LOGGING_MACROS_HPP
#define LOGGING_MACROS_HPP

#include "logger/async_logger.hpp"

// Boxed startup sections in the run log
#define LOG_STARTUP_SECTION_HEADER(title) MeshBridge::Logging::log_message("+-- " + std::string(title), "")
#define LOG_STARTUP_CONTENT(msg) MeshBridge::Logging::log_message("|   " + std::string(msg), "")
#define LOG_STARTUP_SECTION_FOOTER() MeshBridge::Logging::log_message("+-- ", "")

#endif // LOGGING_MACROS_HPP
