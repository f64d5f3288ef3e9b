#ifndef NETBACKUP_PROTOCOL_CODEC_HPP
#define NETBACKUP_PROTOCOL_CODEC_HPP

#include <cstdint>
#include <vector>
#include "netbackup/protocol/message_frame.hpp"
#include "netbackup/protocol/protocol_error.hpp"

namespace netbackup {
namespace protocol {

class Codec {
public:
  enum class DecodeStatus {
    FRAME_READY,
    NEED_MORE_DATA
  };

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // max_length bounds the declared body length accepted by decode()
  explicit Codec(std::size_t max_length = MAX_FRAME_LENGTH) : max_length_(max_length) {}


  // ---- SERIALIZATION ----
  // Serializes a frame including its length prefix. The length is always
  // derived from the payload, throws ProtocolError if it exceeds max_payload
  static std::vector<uint8_t> encode(const MessageFrame& frame,
                                     std::size_t max_payload = MAX_RESPONSE_PAYLOAD_SIZE);


  // ---- INCREMENTAL DESERIALIZATION ----
  // Appends raw bytes read from the transport
  void feed(const uint8_t* data, std::size_t size);
  // Extracts the next complete frame if one is buffered. Throws
  // MalformedFrameError as soon as the declared length is out of bounds
  DecodeStatus decode(MessageFrame& frame);


  // ---- GETTERS ----
  std::size_t buffered_size() const { return buffer_.size(); }
  std::size_t max_length() const { return max_length_; }
  void reset() { buffer_.clear(); }

private:
  // ---- PARAMETERS ----
  std::size_t max_length_;
  std::vector<uint8_t> buffer_;


  // ---- UTILITY METHODS ----
  // Checks a declared body length against the fixed header and maximum frame size
  void validate_length(uint32_t length) const;
  // Parses a complete frame body (everything after the length prefix)
  static MessageFrame parse_body(const uint8_t* body, std::size_t length);
};

} // namespace protocol
} // namespace netbackup

#endif // NETBACKUP_PROTOCOL_CODEC_HPP
