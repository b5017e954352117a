#include "status_reporter.hpp"
#include "logging/logs/status_logs.hpp"

using MeshBridge::Logging::StatusLogs;

namespace MeshBridge {
namespace Status {

void StatusReporter::add_sink(StatusSinkPtr sink) {
    if (sink) {
        sinks.push_back(std::move(sink));
    }
}

std::size_t StatusReporter::publish(bool running) {
    StatusSnapshot snapshot = build_status_snapshot(engine, running);

    std::size_t accepted_count = 0;
    for (StatusSinkPtr& sink : sinks) {
        try {
            sink->publish(snapshot);
            accepted_count++;
        } catch (const std::exception& sink_exception_error) {
            StatusLogs::log_sink_failure(sink->get_sink_name(), sink_exception_error.what());
        }
    }
    return accepted_count;
}

void add_configured_sinks(StatusReporter& status_reporter, const Config::StatusConfig& status_config) {
    if (!status_config.file_path.empty()) {
        status_reporter.add_sink(StatusSinkPtr(new FileStatusSink(status_config.file_path)));
    }
    if (!status_config.webhook_url.empty()) {
        status_reporter.add_sink(StatusSinkPtr(new WebhookStatusSink(status_config.webhook_url, status_config.webhook_timeout_seconds)));
    }
    if (status_config.log_summary) {
        status_reporter.add_sink(StatusSinkPtr(new LogStatusSink()));
    }
}

} // namespace Status
} // namespace MeshBridge
