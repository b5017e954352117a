#ifndef LINK_ERRORS_HPP
#define LINK_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace MeshBridge {
namespace Link {

class LinkError : public std::runtime_error {
public:
    explicit LinkError(const std::string& message) : std::runtime_error(message) {}
};

// Link cannot be opened
class LinkConnectionError : public LinkError {
public:
    explicit LinkConnectionError(const std::string& message) : LinkError(message) {}
};

// Transient send failure; counted, never fatal
class LinkSendError : public LinkError {
public:
    explicit LinkSendError(const std::string& message) : LinkError(message) {}
};

// Device command (reboot) was sent but failed
class LinkCommandError : public LinkError {
public:
    explicit LinkCommandError(const std::string& message) : LinkError(message) {}
};

// Device or link type has no such command
class LinkUnsupportedError : public LinkError {
public:
    explicit LinkUnsupportedError(const std::string& message) : LinkError(message) {}
};

// Malformed inbound message; dropped and counted
class LinkProtocolError : public LinkError {
public:
    explicit LinkProtocolError(const std::string& message) : LinkError(message) {}
};

} // namespace Link
} // namespace MeshBridge

#endif // LINK_ERRORS_HPP
