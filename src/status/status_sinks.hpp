#ifndef STATUS_SINKS_HPP
#define STATUS_SINKS_HPP

#include "status_snapshot.hpp"
#include <memory>
#include <string>

namespace MeshBridge {
namespace Status {

// Destination for periodic status snapshots; publish() throws on failure
class StatusSinkInterface {
public:
    virtual ~StatusSinkInterface() = default;
    virtual void publish(const StatusSnapshot& snapshot) = 0;
    virtual std::string get_sink_name() const = 0;
};

using StatusSinkPtr = std::unique_ptr<StatusSinkInterface>;

// Whole-file replace through a temporary file and rename, so readers never see a partial document
class FileStatusSink : public StatusSinkInterface {
public:
    explicit FileStatusSink(const std::string& status_file_path) : file_path(status_file_path) {}
    void publish(const StatusSnapshot& snapshot) override;
    std::string get_sink_name() const override { return "file:" + file_path; }

private:
    std::string file_path;
};

class WebhookStatusSink : public StatusSinkInterface {
public:
    WebhookStatusSink(const std::string& url, int timeout_seconds) : webhook_url(url), timeout(timeout_seconds) {}
    void publish(const StatusSnapshot& snapshot) override;
    std::string get_sink_name() const override { return "webhook"; }

private:
    std::string webhook_url;
    int timeout;
};

class LogStatusSink : public StatusSinkInterface {
public:
    void publish(const StatusSnapshot& snapshot) override;
    std::string get_sink_name() const override { return "log"; }
};

} // namespace Status
} // namespace MeshBridge

#endif // STATUS_SINKS_HPP
