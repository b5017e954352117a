#include "status_sinks.hpp"
#include "logging/logs/status_logs.hpp"
#include "utils/http_utils.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <stdexcept>

namespace MeshBridge {
namespace Status {

void FileStatusSink::publish(const StatusSnapshot& snapshot) {
    std::string temporary_path = file_path + ".tmp";
    {
        std::ofstream status_stream(temporary_path, std::ios::trunc);
        if (!status_stream.is_open()) {
            throw std::runtime_error("cannot open " + temporary_path + " for writing");
        }
        status_stream << snapshot.to_json().dump(2) << '\n';
        status_stream.flush();
        if (!status_stream.good()) {
            throw std::runtime_error("write to " + temporary_path + " failed");
        }
    }
    if (std::rename(temporary_path.c_str(), file_path.c_str()) != 0) {
        int saved_errno = errno;
        std::remove(temporary_path.c_str());
        throw std::runtime_error("rename to " + file_path + " failed: " + std::strerror(saved_errno));
    }
}

void WebhookStatusSink::publish(const StatusSnapshot& snapshot) {
    HttpUtils::HttpRequest status_request(webhook_url, snapshot.to_json().dump(), timeout);
    HttpUtils::http_post(status_request);
}

void LogStatusSink::publish(const StatusSnapshot& snapshot) {
    Logging::StatusLogs::log_status_summary(snapshot.to_summary_line());
}

} // namespace Status
} // namespace MeshBridge
