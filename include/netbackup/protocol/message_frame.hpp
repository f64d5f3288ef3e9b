#ifndef NETBACKUP_PROTOCOL_MESSAGE_FRAME_HPP
#define NETBACKUP_PROTOCOL_MESSAGE_FRAME_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace netbackup {
namespace protocol {

// SHA-256 digest as carried in the frame header
using Digest = std::array<uint8_t, 32>;

// Operation requested by a frame
enum class OpCode : uint8_t {
  STORE = 0x01,
  RETRIEVE = 0x02,
  DELETE = 0x03,
  LIST = 0x04,
  AUTH = 0x05,
  STORE_CHUNK = 0x06,
  RETRIEVE_CHUNK = 0x07,
  STORE_COMPLETE = 0x08
};

// Outcome reported by the server, zero on requests
enum class StatusCode : uint8_t {
  SUCCESS = 0x00,
  NOT_FOUND = 0x01,
  PERMISSION_DENIED = 0x02,
  INVALID_DATA = 0x03,
  SERVER_ERROR = 0x04
};

// ---- WIRE CONSTANTS ----
constexpr std::size_t LENGTH_PREFIX_SIZE = 4;
// request_id + op_code + status + checksum + auth_token
constexpr std::size_t HEADER_SIZE = 4 + 1 + 1 + 32 + 32;
constexpr std::size_t CHUNK_SIZE = 65536;
constexpr std::size_t MAX_FILENAME_LENGTH = 255;
// Largest chunk payload: name_len, name, chunk_index, total_chunks, data_len, data
constexpr std::size_t MAX_PAYLOAD_SIZE = 4 + MAX_FILENAME_LENGTH + 4 + 4 + 4 + CHUNK_SIZE;
constexpr std::size_t MAX_FRAME_LENGTH = HEADER_SIZE + MAX_PAYLOAD_SIZE;
// Responses may carry a whole listing or a single-message retrieve
constexpr std::size_t MAX_RESPONSE_PAYLOAD_SIZE = 64 * 1024 * 1024;
constexpr std::size_t MAX_RESPONSE_FRAME_LENGTH = HEADER_SIZE + MAX_RESPONSE_PAYLOAD_SIZE;

// Data structure used to represent a frame locally
struct MessageFrame {
  uint32_t request_id = 0;
  OpCode op_code = OpCode::AUTH;
  StatusCode status = StatusCode::SUCCESS;
  Digest checksum{};
  Digest auth_token{};
  std::vector<uint8_t> payload;
};

inline bool operator==(const MessageFrame& lhs, const MessageFrame& rhs) {
  return lhs.request_id == rhs.request_id
      && lhs.op_code == rhs.op_code
      && lhs.status == rhs.status
      && lhs.checksum == rhs.checksum
      && lhs.auth_token == rhs.auth_token
      && lhs.payload == rhs.payload;
}

inline bool operator!=(const MessageFrame& lhs, const MessageFrame& rhs) {
  return !(lhs == rhs);
}

inline bool is_valid_op_code(uint8_t value) {
  return value >= static_cast<uint8_t>(OpCode::STORE)
      && value <= static_cast<uint8_t>(OpCode::STORE_COMPLETE);
}

inline const char* op_code_to_string(OpCode op) {
  switch (op) {
    case OpCode::STORE: return "Store";
    case OpCode::RETRIEVE: return "Retrieve";
    case OpCode::DELETE: return "Delete";
    case OpCode::LIST: return "List";
    case OpCode::AUTH: return "Auth";
    case OpCode::STORE_CHUNK: return "StoreChunk";
    case OpCode::RETRIEVE_CHUNK: return "RetrieveChunk";
    case OpCode::STORE_COMPLETE: return "StoreComplete";
    default: return "Unknown";
  }
}

inline const char* status_to_string(StatusCode status) {
  switch (status) {
    case StatusCode::SUCCESS: return "Success";
    case StatusCode::NOT_FOUND: return "Not found";
    case StatusCode::PERMISSION_DENIED: return "Permission denied";
    case StatusCode::INVALID_DATA: return "Invalid data";
    case StatusCode::SERVER_ERROR: return "Server error";
    default: return "Undefined status";
  }
}

} // namespace protocol
} // namespace netbackup

#endif // NETBACKUP_PROTOCOL_MESSAGE_FRAME_HPP
