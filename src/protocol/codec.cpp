#include "netbackup/protocol/codec.hpp"
#include "netbackup/protocol/byte_order.hpp"
#include <boost/log/trivial.hpp>
#include <string>

namespace netbackup {
namespace protocol {

//==============================================
// SERIALIZATION
//==============================================

std::vector<uint8_t> Codec::encode(const MessageFrame& frame, std::size_t max_payload) {
  if (frame.payload.size() > max_payload) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Payload of " << frame.payload.size()
                             << " bytes exceeds maximum of " << max_payload;
    throw ProtocolError("Codec: Payload exceeds maximum frame length");
  }

  const uint32_t length = static_cast<uint32_t>(HEADER_SIZE + frame.payload.size());

  std::vector<uint8_t> output;
  output.reserve(LENGTH_PREFIX_SIZE + length);
  ByteWriter writer(output);

  writer.write_int(length);
  writer.write_int(frame.request_id);
  writer.write_u8(static_cast<uint8_t>(frame.op_code));
  writer.write_u8(static_cast<uint8_t>(frame.status));
  writer.write_bytes(frame.checksum.data(), frame.checksum.size());
  writer.write_bytes(frame.auth_token.data(), frame.auth_token.size());
  writer.write_bytes(frame.payload.data(), frame.payload.size());

  BOOST_LOG_TRIVIAL(trace) << "Codec: Encoded " << op_code_to_string(frame.op_code)
                           << " frame, request id " << frame.request_id
                           << ", total bytes: " << output.size();
  return output;
}


//==============================================
// INCREMENTAL DESERIALIZATION
//==============================================

void Codec::feed(const uint8_t* data, std::size_t size) {
  buffer_.insert(buffer_.end(), data, data + size);
}

Codec::DecodeStatus Codec::decode(MessageFrame& frame) {
  if (buffer_.size() < LENGTH_PREFIX_SIZE) {
    return DecodeStatus::NEED_MORE_DATA;
  }

  ByteReader prefix(buffer_.data(), LENGTH_PREFIX_SIZE);
  const uint32_t length = prefix.read_int<uint32_t>();

  // Reject before waiting for (and buffering) the body
  validate_length(length);

  if (buffer_.size() < LENGTH_PREFIX_SIZE + length) {
    return DecodeStatus::NEED_MORE_DATA;
  }

  frame = parse_body(buffer_.data() + LENGTH_PREFIX_SIZE, length);
  buffer_.erase(buffer_.begin(), buffer_.begin() + LENGTH_PREFIX_SIZE + length);

  BOOST_LOG_TRIVIAL(trace) << "Codec: Decoded frame with request id " << frame.request_id
                           << ", " << buffer_.size() << " bytes left buffered";
  return DecodeStatus::FRAME_READY;
}


//==============================================
// UTILITY METHODS
//==============================================

void Codec::validate_length(uint32_t length) const {
  if (length < HEADER_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Declared length " << length << " is shorter than the fixed header";
    throw MalformedFrameError("declared length " + std::to_string(length) + " is shorter than header");
  }
  if (length > max_length_) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Declared length " << length << " exceeds maximum of " << max_length_;
    throw MalformedFrameError("declared length " + std::to_string(length) + " exceeds maximum");
  }
}

MessageFrame Codec::parse_body(const uint8_t* body, std::size_t length) {
  ByteReader reader(body, length);
  MessageFrame frame;

  frame.request_id = reader.read_int<uint32_t>();
  frame.op_code = static_cast<OpCode>(reader.read_u8());
  frame.status = static_cast<StatusCode>(reader.read_u8());
  reader.read_bytes(frame.checksum.data(), frame.checksum.size());
  reader.read_bytes(frame.auth_token.data(), frame.auth_token.size());

  const uint8_t* payload = body + HEADER_SIZE;
  frame.payload.assign(payload, payload + (length - HEADER_SIZE));
  return frame;
}

} // namespace protocol
} // namespace netbackup
