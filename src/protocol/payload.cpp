#include "netbackup/protocol/payload.hpp"
#include "netbackup/protocol/byte_order.hpp"
#include <algorithm>

namespace netbackup {
namespace protocol {

namespace {

// Fixed part of a listing record: name_len, size, modified_time, checksum
constexpr std::size_t LISTING_RECORD_MIN_SIZE = 4 + 8 + 8 + 32;

void expect_consumed(const ByteReader& reader, const char* what) {
  if (reader.remaining() != 0) {
    throw PayloadError(std::string(what) + " has " + std::to_string(reader.remaining()) + " trailing bytes");
  }
}

} // namespace

//==============================================
// CHUNK PAYLOADS
//==============================================

uint32_t chunk_count(uint64_t size) {
  if (size == 0) {
    return 1;
  }
  uint64_t count = (size + CHUNK_SIZE - 1) / CHUNK_SIZE;
  if (count > UINT32_MAX) {
    throw PayloadError("file of " + std::to_string(size) + " bytes needs too many chunks");
  }
  return static_cast<uint32_t>(count);
}

std::vector<uint8_t> encode_chunk(const ChunkPayload& chunk, bool with_data) {
  std::vector<uint8_t> payload;
  payload.reserve(4 + chunk.filename.size() + 12 + (with_data ? chunk.data.size() : 0));
  ByteWriter writer(payload);

  writer.write_string(chunk.filename);
  writer.write_int(chunk.chunk_index);
  writer.write_int(chunk.total_chunks);
  if (with_data) {
    writer.write_sized(chunk.data.data(), chunk.data.size());
  }
  return payload;
}

ChunkPayload decode_chunk(const std::vector<uint8_t>& payload, bool with_data) {
  ByteReader reader(payload);
  ChunkPayload chunk;

  chunk.filename = reader.read_string(MAX_FILENAME_LENGTH);
  chunk.chunk_index = reader.read_int<uint32_t>();
  chunk.total_chunks = reader.read_int<uint32_t>();
  if (with_data) {
    chunk.data = reader.read_sized(CHUNK_SIZE);
  }
  expect_consumed(reader, "Chunk payload");
  return chunk;
}


//==============================================
// FILENAME-ONLY PAYLOADS
//==============================================

std::vector<uint8_t> encode_filename(const std::string& filename) {
  return to_bytes(filename);
}

std::string decode_filename(const std::vector<uint8_t>& payload) {
  if (payload.size() > MAX_FILENAME_LENGTH) {
    throw PayloadError("filename of " + std::to_string(payload.size()) + " bytes is too long");
  }
  return to_text(payload);
}


//==============================================
// LEGACY STORE PAYLOAD
//==============================================

std::vector<uint8_t> encode_store(const StorePayload& store) {
  std::vector<uint8_t> payload;
  payload.reserve(store.filename.size() + 1 + store.data.size());
  payload.insert(payload.end(), store.filename.begin(), store.filename.end());
  payload.push_back(0);
  payload.insert(payload.end(), store.data.begin(), store.data.end());
  return payload;
}

StorePayload decode_store(const std::vector<uint8_t>& payload) {
  auto separator = std::find(payload.begin(), payload.end(), uint8_t{0});
  if (separator == payload.end()) {
    throw PayloadError("Store payload has no filename terminator");
  }

  StorePayload store;
  store.filename.assign(payload.begin(), separator);
  if (store.filename.size() > MAX_FILENAME_LENGTH) {
    throw PayloadError("filename of " + std::to_string(store.filename.size()) + " bytes is too long");
  }
  store.data.assign(separator + 1, payload.end());
  return store;
}


//==============================================
// LIST RESPONSE PAYLOAD
//==============================================

std::vector<uint8_t> encode_listing(const std::vector<store::FileMetadata>& files) {
  std::vector<uint8_t> payload;
  ByteWriter writer(payload);

  writer.write_int(static_cast<uint32_t>(files.size()));
  for (const auto& file : files) {
    writer.write_string(file.filename);
    writer.write_int(file.size);
    writer.write_int(file.modified_time);
    writer.write_bytes(file.checksum.data(), file.checksum.size());
  }
  return payload;
}

std::vector<store::FileMetadata> decode_listing(const std::vector<uint8_t>& payload) {
  ByteReader reader(payload);
  const uint32_t count = reader.read_int<uint32_t>();

  // Each record needs at least its fixed fields, so a hostile count cannot force a huge reserve
  if (count > reader.remaining() / LISTING_RECORD_MIN_SIZE) {
    throw PayloadError("listing declares " + std::to_string(count) + " records but is too short");
  }

  std::vector<store::FileMetadata> files;
  files.reserve(count);
  for (uint32_t i = 0; i < count; ++i) {
    store::FileMetadata file;
    file.filename = reader.read_string(MAX_FILENAME_LENGTH);
    file.size = reader.read_int<uint64_t>();
    file.modified_time = reader.read_int<uint64_t>();
    reader.read_bytes(file.checksum.data(), file.checksum.size());
    files.push_back(std::move(file));
  }
  expect_consumed(reader, "Listing payload");
  return files;
}


//==============================================
// TEXT PAYLOADS
//==============================================

std::vector<uint8_t> to_bytes(const std::string& text) {
  return std::vector<uint8_t>(text.begin(), text.end());
}

std::string to_text(const std::vector<uint8_t>& payload) {
  return std::string(payload.begin(), payload.end());
}

} // namespace protocol
} // namespace netbackup
