#ifndef NETBACKUP_PROTOCOL_PAYLOAD_HPP
#define NETBACKUP_PROTOCOL_PAYLOAD_HPP

#include <cstdint>
#include <string>
#include <vector>
#include "netbackup/protocol/message_frame.hpp"
#include "netbackup/protocol/protocol_error.hpp"
#include "netbackup/store/file_metadata.hpp"

namespace netbackup {
namespace protocol {

// Body of StoreChunk requests and RetrieveChunk requests/responses
struct ChunkPayload {
  std::string filename;
  uint32_t chunk_index = 0;
  uint32_t total_chunks = 0;
  std::vector<uint8_t> data;
};

// Body of a single-message Store request
struct StorePayload {
  std::string filename;
  std::vector<uint8_t> data;
};

// ---- CHUNK PAYLOADS ----
// Number of chunks a file of `size` bytes is split into. An empty file is one empty chunk.
uint32_t chunk_count(uint64_t size);
// with_data is false only for RetrieveChunk requests, which carry no data field
std::vector<uint8_t> encode_chunk(const ChunkPayload& chunk, bool with_data = true);
ChunkPayload decode_chunk(const std::vector<uint8_t>& payload, bool with_data = true);


// ---- FILENAME-ONLY PAYLOADS (Retrieve, Delete, StoreComplete) ----
std::vector<uint8_t> encode_filename(const std::string& filename);
std::string decode_filename(const std::vector<uint8_t>& payload);


// ---- LEGACY STORE PAYLOAD ----
// Layout: filename, NUL, data
std::vector<uint8_t> encode_store(const StorePayload& store);
StorePayload decode_store(const std::vector<uint8_t>& payload);


// ---- LIST RESPONSE PAYLOAD ----
std::vector<uint8_t> encode_listing(const std::vector<store::FileMetadata>& files);
std::vector<store::FileMetadata> decode_listing(const std::vector<uint8_t>& payload);


// ---- TEXT PAYLOADS ----
std::vector<uint8_t> to_bytes(const std::string& text);
std::string to_text(const std::vector<uint8_t>& payload);

} // namespace protocol
} // namespace netbackup

#endif // NETBACKUP_PROTOCOL_PAYLOAD_HPP
