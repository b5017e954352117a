#ifndef SERIAL_RADIO_LINK_HPP
#define SERIAL_RADIO_LINK_HPP

#include "radio_link_interface.hpp"
#include "configs/link_config.hpp"
#include "utils/time_utils.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

namespace MeshBridge {
namespace Link {

/**
 * Radio reached through a USB serial port running the companion JSON-lines API.
 *
 * One object per connection attempt. open() configures the tty in raw 8N1 mode,
 * waits out the radio's boot through settle_sleeper, starts a reader thread and
 * asks the radio for its identity; close() stops the reader and releases the
 * descriptor. Inbound packets and connection loss are
 * reported through the registered callbacks on the reader thread.
 */
class SerialRadioLink : public RadioLinkInterface {
public:
    SerialRadioLink(const Config::LinkConfig& link_config, const std::string& reader_thread_tag,
                    TimeUtils::InterruptibleSleep settle_sleeper);
    ~SerialRadioLink() override;

    SerialRadioLink(const SerialRadioLink&) = delete;
    SerialRadioLink& operator=(const SerialRadioLink&) = delete;

    void open(const std::string& port) override;
    void close() override;
    bool is_open() const override;

    void send(const MeshPacket& packet) override;

    void register_receive_callback(ReceiveCallback callback) override;
    void register_connection_lost_callback(ConnectionLostCallback callback) override;

    bool is_responsive() override;
    void request_reboot() override;

    LinkIdentity get_identity() const override;
    std::string get_link_type() const override { return "serial"; }

    uint64_t get_protocol_error_count() const { return protocol_error_count.load(); }

private:
    void reader_loop();
    void process_inbound_line(const std::string& line);
    void write_json_line(const std::string& serialized_line);
    void report_connection_lost(const std::string& reason);

    const Config::LinkConfig& config;
    std::string reader_thread_tag;
    TimeUtils::InterruptibleSleep settle_sleeper;
    std::string port_name;

    int file_descriptor = -1;
    std::atomic<bool> open_flag{false};
    std::atomic<bool> stop_requested{false};
    std::atomic<bool> used{false};
    std::atomic<bool> loss_reported{false};
    std::thread reader_thread;

    std::mutex write_mutex;

    mutable std::mutex state_mutex;
    std::condition_variable state_cv;
    LinkIdentity identity;
    uint64_t inbound_line_counter = 0;

    std::atomic<uint64_t> protocol_error_count{0};

    ReceiveCallback receive_callback;
    ConnectionLostCallback connection_lost_callback;
};

} // namespace Link
} // namespace MeshBridge

#endif // SERIAL_RADIO_LINK_HPP
