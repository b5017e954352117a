#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <string>
#include <chrono>
#include <functional>

namespace MeshBridge {
namespace TimeUtils {

constexpr long long MILLISECONDS_PER_SECOND = 1000;
constexpr long long SECONDS_PER_MINUTE = 60;
constexpr long long SECONDS_PER_HOUR = 3600;

// strftime patterns
constexpr const char* ISO_8601_WITH_Z = "%Y-%m-%dT%H:%M:%SZ";
constexpr const char* HUMAN_READABLE = "%Y-%m-%d %H:%M:%S";
constexpr const char* LOG_FILENAME = "%d-%H-%M";

// Sleeps up to the given duration; returns false when cut short by shutdown
using InterruptibleSleep = std::function<bool(std::chrono::milliseconds)>;

// UTC, used in status snapshots and alert payloads
std::string get_current_iso_time_with_z();

// Local time, used as the log line prefix
std::string get_current_human_readable_time();

// Wall-clock seconds since the Unix epoch, with sub-second precision
double get_current_epoch_seconds();

// Seconds elapsed on the steady clock since start_time
double seconds_since(const std::chrono::steady_clock::time_point& start_time);

// "1h 02m 03s" style duration for log lines
std::string format_duration_seconds(long long total_seconds);

} // namespace TimeUtils
} // namespace MeshBridge

#endif // TIME_UTILS_HPP
