#ifndef NETBACKUP_PROTOCOL_ERROR_HPP
#define NETBACKUP_PROTOCOL_ERROR_HPP

#include <stdexcept>
#include <string>

namespace netbackup::protocol {

class ProtocolError : public std::runtime_error {
public:
  explicit ProtocolError(const std::string& message)
    : std::runtime_error(message) {}
};

// Frame boundaries cannot be determined, the connection must be dropped
class MalformedFrameError : public ProtocolError {
public:
  explicit MalformedFrameError(const std::string& message)
    : ProtocolError("Malformed frame: " + message) {}
};

// Frame is intact but its payload does not match the layout of its op code
class PayloadError : public ProtocolError {
public:
  explicit PayloadError(const std::string& message)
    : ProtocolError("Invalid payload: " + message) {}
};

} // namespace netbackup::protocol

#endif // NETBACKUP_PROTOCOL_ERROR_HPP
