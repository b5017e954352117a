#ifndef RADIO_LINK_INTERFACE_HPP
#define RADIO_LINK_INTERFACE_HPP

#include "link_errors.hpp"
#include "mesh_packet.hpp"
#include <functional>
#include <memory>
#include <string>

namespace MeshBridge {
namespace Link {

using ReceiveCallback = std::function<void(const MeshPacket& packet)>;
using ConnectionLostCallback = std::function<void(const std::string& reason)>;

/**
 * Capability interface over one radio connection.
 *
 * A link object is the handle: open() it once, close() it once, and create a
 * fresh object for the next attempt. Callbacks must be registered before open()
 * and are invoked from the link's own I/O thread.
 */
class RadioLinkInterface {
public:
    virtual ~RadioLinkInterface() = default;

    // Throws LinkConnectionError
    virtual void open(const std::string& port) = 0;
    virtual void close() = 0;
    virtual bool is_open() const = 0;

    // Throws LinkSendError
    virtual void send(const MeshPacket& packet) = 0;

    virtual void register_receive_callback(ReceiveCallback callback) = 0;
    virtual void register_connection_lost_callback(ConnectionLostCallback callback) = 0;

    // Cheap liveness probe, never throws
    virtual bool is_responsive() = 0;

    // Throws LinkUnsupportedError or LinkCommandError
    virtual void request_reboot() = 0;

    virtual LinkIdentity get_identity() const = 0;
    virtual std::string get_link_type() const = 0;
};

using RadioLinkPtr = std::unique_ptr<RadioLinkInterface>;
using RadioLinkFactory = std::function<RadioLinkPtr()>;

} // namespace Link
} // namespace MeshBridge

#endif // RADIO_LINK_INTERFACE_HPP
