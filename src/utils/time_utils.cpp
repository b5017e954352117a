#include "time_utils.hpp"
#include <cstdio>
#include <ctime>

namespace MeshBridge {
namespace TimeUtils {

namespace {

std::string format_now(const char* time_format, bool utc) {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm broken_down_time {};
    if (utc) {
        gmtime_r(&now, &broken_down_time);
    } else {
        localtime_r(&now, &broken_down_time);
    }
    char formatted[64];
    std::size_t written = std::strftime(formatted, sizeof(formatted), time_format, &broken_down_time);
    return std::string(formatted, written);
}

} // namespace

std::string get_current_iso_time_with_z() {
    return format_now(ISO_8601_WITH_Z, true);
}

std::string get_current_human_readable_time() {
    return format_now(HUMAN_READABLE, false);
}

double get_current_epoch_seconds() {
    return std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch()).count();
}

double seconds_since(const std::chrono::steady_clock::time_point& start_time) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time).count();
}

std::string format_duration_seconds(long long total_seconds) {
    if (total_seconds < 0) {
        total_seconds = 0;
    }
    char formatted[48];
    std::snprintf(formatted, sizeof(formatted), "%lldh %02lldm %02llds",
                  total_seconds / SECONDS_PER_HOUR,
                  (total_seconds % SECONDS_PER_HOUR) / SECONDS_PER_MINUTE,
                  total_seconds % SECONDS_PER_MINUTE);
    return formatted;
}

} // namespace TimeUtils
} // namespace MeshBridge
