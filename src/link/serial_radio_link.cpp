#include "serial_radio_link.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logs/link_logs.hpp"
#include <nlohmann/json.hpp>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <stdexcept>
#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>

using json = nlohmann::json;
using MeshBridge::Logging::LinkLogs;

namespace MeshBridge {
namespace Link {

namespace {
    constexpr int READER_POLL_TIMEOUT_MILLISECONDS = 200;
    constexpr int WRITE_POLL_TIMEOUT_MILLISECONDS = 1000;
    constexpr int REBOOT_DELAY_SECONDS = 2;
    constexpr std::size_t MAX_LINE_LENGTH = 4096;

    speed_t baud_to_speed(int baud_rate) {
        switch (baud_rate) {
            case 9600: return B9600;
            case 19200: return B19200;
            case 38400: return B38400;
            case 57600: return B57600;
            case 230400: return B230400;
            case 460800: return B460800;
            case 921600: return B921600;
            default: return B115200;
        }
    }

    // Raw 8N1, no flow control, non-blocking reads (poll drives timing)
    bool set_raw(int fd, speed_t baud) {
        termios tio{};
        if (tcgetattr(fd, &tio) != 0) return false;
        cfmakeraw(&tio);
        cfsetispeed(&tio, baud);
        cfsetospeed(&tio, baud);
        tio.c_cflag |= (CLOCAL | CREAD);
        tio.c_cflag &= ~CRTSCTS;
        tio.c_cc[VMIN] = 0;
        tio.c_cc[VTIME] = 0;
        if (tcsetattr(fd, TCSANOW, &tio) != 0) return false;
        tcflush(fd, TCIOFLUSH);
        return true;
    }

    std::string id_field_to_string(const json& id_value) {
        if (id_value.is_number_unsigned() || id_value.is_number_integer()) {
            return std::to_string(id_value.get<uint64_t>());
        }
        if (id_value.is_string()) {
            return id_value.get<std::string>();
        }
        return "";
    }
}

SerialRadioLink::SerialRadioLink(const Config::LinkConfig& link_config, const std::string& thread_tag,
                                 TimeUtils::InterruptibleSleep sleeper)
    : config(link_config), reader_thread_tag(thread_tag), settle_sleeper(std::move(sleeper)) {
    if (!settle_sleeper) {
        throw std::runtime_error("SerialRadioLink requires a sleep function");
    }
}

SerialRadioLink::~SerialRadioLink() {
    try {
        close();
    } catch (const std::exception& close_exception_error) {
        LinkLogs::log_serial_read_error(port_name, close_exception_error.what());
    }
}

void SerialRadioLink::open(const std::string& port) {
    if (used.exchange(true)) {
        throw LinkConnectionError("Serial link handle for " + port + " was already opened once");
    }
    port_name = port;

    int fd = ::open(port.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd < 0) {
        throw LinkConnectionError("Cannot open " + port + ": " + std::strerror(errno));
    }
    if (!set_raw(fd, baud_to_speed(config.baud_rate))) {
        int saved_errno = errno;
        ::close(fd);
        throw LinkConnectionError("Cannot configure " + port + ": " + std::strerror(saved_errno));
    }

    // USB CDC radios reset on open; drop whatever they print while booting
    if (!settle_sleeper(std::chrono::milliseconds(config.open_settle_milliseconds))) {
        ::close(fd);
        throw LinkConnectionError("Open of " + port + " interrupted by shutdown");
    }
    tcflush(fd, TCIOFLUSH);

    file_descriptor = fd;
    stop_requested.store(false);
    open_flag.store(true);
    LinkLogs::log_serial_opened(port, config.baud_rate);

    reader_thread = std::thread(&SerialRadioLink::reader_loop, this);

    try {
        write_json_line(json{{"type", "want_config"}}.dump());
    } catch (const LinkSendError& send_exception_error) {
        close();
        throw LinkConnectionError("Radio on " + port + " rejected config request: " + send_exception_error.what());
    }

    std::unique_lock<std::mutex> state_lock(state_mutex);
    bool identity_received = state_cv.wait_for(state_lock, std::chrono::milliseconds(config.identity_timeout_milliseconds),
        [this] { return identity.is_known() || !open_flag.load(); });
    bool still_open = open_flag.load();
    state_lock.unlock();

    if (!still_open) {
        close();
        throw LinkConnectionError("Radio on " + port + " hung up during connect");
    }
    if (!identity_received) {
        LinkLogs::log_serial_identity_timeout(port);
    }
}

void SerialRadioLink::close() {
    stop_requested.store(true);
    open_flag.store(false);
    state_cv.notify_all();

    if (reader_thread.joinable()) {
        if (reader_thread.get_id() == std::this_thread::get_id()) {
            reader_thread.detach();
        } else {
            reader_thread.join();
        }
    }

    std::lock_guard<std::mutex> write_lock(write_mutex);
    if (file_descriptor >= 0) {
        ::close(file_descriptor);
        file_descriptor = -1;
    }
}

bool SerialRadioLink::is_open() const {
    return open_flag.load();
}

void SerialRadioLink::send(const MeshPacket& packet) {
    if (!open_flag.load()) {
        throw LinkSendError("Serial link " + port_name + " is not open");
    }
    json outbound = {
        {"type", "send_text"},
        {"text", packet.text},
        {"channel", packet.channel},
        {"to", packet.to_id.empty() ? std::string(BROADCAST_ADDRESS) : packet.to_id}
    };
    write_json_line(outbound.dump());
}

void SerialRadioLink::register_receive_callback(ReceiveCallback callback) {
    receive_callback = std::move(callback);
}

void SerialRadioLink::register_connection_lost_callback(ConnectionLostCallback callback) {
    connection_lost_callback = std::move(callback);
}

bool SerialRadioLink::is_responsive() {
    if (!open_flag.load()) {
        return false;
    }

    uint64_t lines_before_probe;
    {
        std::lock_guard<std::mutex> state_lock(state_mutex);
        lines_before_probe = inbound_line_counter;
    }

    try {
        write_json_line(json{{"type", "ping"}}.dump());
    } catch (const LinkSendError& send_exception_error) {
        return false;
    }

    std::unique_lock<std::mutex> state_lock(state_mutex);
    return state_cv.wait_for(state_lock, std::chrono::milliseconds(config.probe_timeout_milliseconds),
        [this, lines_before_probe] { return inbound_line_counter != lines_before_probe || !open_flag.load(); })
        && open_flag.load();
}

void SerialRadioLink::request_reboot() {
    if (!open_flag.load()) {
        throw LinkCommandError("Cannot reboot radio on " + port_name + ": link not open");
    }
    try {
        write_json_line(json{{"type", "reboot"}, {"seconds", REBOOT_DELAY_SECONDS}}.dump());
    } catch (const LinkSendError& send_exception_error) {
        throw LinkCommandError(std::string("Reboot command failed: ") + send_exception_error.what());
    }
}

LinkIdentity SerialRadioLink::get_identity() const {
    std::lock_guard<std::mutex> state_lock(state_mutex);
    return identity;
}

void SerialRadioLink::write_json_line(const std::string& serialized_line) {
    std::lock_guard<std::mutex> write_lock(write_mutex);
    if (file_descriptor < 0) {
        throw LinkSendError("Serial link " + port_name + " is closed");
    }

    std::string wire_line = serialized_line + "\n";
    std::size_t bytes_written = 0;
    while (bytes_written < wire_line.size()) {
        ssize_t write_result = ::write(file_descriptor, wire_line.data() + bytes_written, wire_line.size() - bytes_written);
        if (write_result > 0) {
            bytes_written += static_cast<std::size_t>(write_result);
            continue;
        }
        if (write_result < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
            pollfd write_poll{file_descriptor, POLLOUT, 0};
            if (::poll(&write_poll, 1, WRITE_POLL_TIMEOUT_MILLISECONDS) <= 0) {
                throw LinkSendError("Write to " + port_name + " timed out");
            }
            continue;
        }
        throw LinkSendError("Write to " + port_name + " failed: " + std::strerror(errno));
    }
}

void SerialRadioLink::reader_loop() {
    Logging::set_log_thread_tag(reader_thread_tag);

    std::string line_buffer;
    char read_chunk[512];

    while (!stop_requested.load()) {
        try {
            pollfd read_poll{file_descriptor, POLLIN, 0};
            int poll_result = ::poll(&read_poll, 1, READER_POLL_TIMEOUT_MILLISECONDS);
            if (poll_result == 0) {
                continue;
            }
            if (poll_result < 0) {
                if (errno == EINTR) continue;
                report_connection_lost(std::string("poll failed: ") + std::strerror(errno));
                break;
            }
            if (read_poll.revents & (POLLERR | POLLHUP | POLLNVAL)) {
                report_connection_lost("device hung up");
                break;
            }

            ssize_t bytes_read = ::read(file_descriptor, read_chunk, sizeof(read_chunk));
            if (bytes_read < 0) {
                if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
                LinkLogs::log_serial_read_error(port_name, std::strerror(errno));
                report_connection_lost(std::string("read failed: ") + std::strerror(errno));
                break;
            }
            if (bytes_read == 0) {
                report_connection_lost("device closed the port");
                break;
            }

            line_buffer.append(read_chunk, static_cast<std::size_t>(bytes_read));
            std::size_t newline_position;
            while ((newline_position = line_buffer.find('\n')) != std::string::npos) {
                std::string line = line_buffer.substr(0, newline_position);
                line_buffer.erase(0, newline_position + 1);
                if (!line.empty() && line.back() == '\r') line.pop_back();
                if (line.empty()) continue;
                try {
                    process_inbound_line(line);
                } catch (const LinkProtocolError& protocol_exception_error) {
                    protocol_error_count.fetch_add(1);
                    LinkLogs::log_serial_protocol_error(port_name, protocol_exception_error.what());
                }
            }
            if (line_buffer.size() > MAX_LINE_LENGTH) {
                protocol_error_count.fetch_add(1);
                LinkLogs::log_serial_protocol_error(port_name, "line exceeds " + std::to_string(MAX_LINE_LENGTH) + " bytes");
                line_buffer.clear();
            }
        } catch (const std::exception& reader_exception_error) {
            LinkLogs::log_serial_reader_exception(port_name, reader_exception_error.what());
        } catch (...) {
            LinkLogs::log_serial_reader_exception(port_name, "unknown exception");
        }
    }

    Logging::clear_log_thread_tag();
}

void SerialRadioLink::process_inbound_line(const std::string& line) {
    // Radios print plain-text debug output on the same port
    if (line[0] != '{') {
        Logging::log_debug_message(port_name + ": " + line);
        return;
    }

    json inbound = json::parse(line, nullptr, false);
    if (inbound.is_discarded() || !inbound.is_object()) {
        throw LinkProtocolError("not a JSON object: " + line.substr(0, 60));
    }

    {
        std::lock_guard<std::mutex> state_lock(state_mutex);
        inbound_line_counter++;
    }
    state_cv.notify_all();

    std::string message_type;
    try {
        message_type = inbound.value("type", std::string());
    } catch (const json::exception& json_exception_error) {
        throw LinkProtocolError(std::string("bad type field: ") + json_exception_error.what());
    }
    if (message_type == "packet") {
        try {
            MeshPacket packet;
            if (inbound.contains("id")) {
                packet.id = id_field_to_string(inbound["id"]);
            }
            packet.from_id = inbound.value("fromId", std::string());
            packet.to_id = inbound.value("toId", std::string(BROADCAST_ADDRESS));
            packet.channel = inbound.value("channel", 0);
            packet.portnum = inbound.value("portnum", std::string());
            packet.text = inbound.value("text", std::string());
            if (receive_callback) {
                receive_callback(packet);
            }
        } catch (const json::exception& json_exception_error) {
            throw LinkProtocolError(std::string("bad packet field: ") + json_exception_error.what());
        }
    } else if (message_type == "my_info") {
        try {
            std::lock_guard<std::mutex> state_lock(state_mutex);
            identity.node_id = inbound.value("node_id", std::string());
            identity.node_num = inbound.value("node_num", 0u);
            identity.hw_model = inbound.value("hw_model", std::string());
        } catch (const json::exception& json_exception_error) {
            throw LinkProtocolError(std::string("bad my_info field: ") + json_exception_error.what());
        }
        state_cv.notify_all();
    } else if (message_type != "pong") {
        Logging::log_debug_message(port_name + ": ignoring message type '" + message_type + "'");
    }
}

void SerialRadioLink::report_connection_lost(const std::string& reason) {
    open_flag.store(false);
    state_cv.notify_all();
    if (loss_reported.exchange(true)) {
        return;
    }
    if (!stop_requested.load() && connection_lost_callback) {
        connection_lost_callback(reason);
    }
}

} // namespace Link
} // namespace MeshBridge
