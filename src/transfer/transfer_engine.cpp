#include "netbackup/transfer/transfer_engine.hpp"
#include <boost/log/trivial.hpp>
#include <utility>

namespace netbackup {
namespace transfer {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

TransferEngine::TransferEngine(store::Store& store, std::size_t buffer_limit)
  : store_(store)
  , buffer_limit_(buffer_limit) {
}

TransferEngine::~TransferEngine() {
  abandon_all();
}


//==============================================
// UPLOADS
//==============================================

bool TransferEngine::store_chunk(const protocol::ChunkPayload& chunk) {
  store::Store::validate_filename(chunk.filename);

  if (chunk.total_chunks == 0) {
    throw TransferError("total_chunks must be at least 1");
  }
  if (chunk.chunk_index >= chunk.total_chunks) {
    throw TransferError("chunk index " + std::to_string(chunk.chunk_index)
                        + " out of range for " + std::to_string(chunk.total_chunks) + " chunks");
  }
  if (chunk.data.size() > protocol::CHUNK_SIZE) {
    throw TransferError("chunk of " + std::to_string(chunk.data.size()) + " bytes exceeds chunk size");
  }

  auto it = uploads_.find(chunk.filename);
  if (it != uploads_.end() && it->second.total_chunks != chunk.total_chunks) {
    throw TransferError("total_chunks changed from " + std::to_string(it->second.total_chunks)
                        + " to " + std::to_string(chunk.total_chunks));
  }

  // Duplicate indices replace the earlier buffer, so count only the difference
  std::size_t replaced = 0;
  if (it != uploads_.end()) {
    auto existing = it->second.chunks.find(chunk.chunk_index);
    if (existing != it->second.chunks.end()) {
      replaced = existing->second.size();
    }
  }
  std::size_t projected = buffered_bytes_ - replaced + chunk.data.size();
  if (projected > buffer_limit_) {
    BOOST_LOG_TRIVIAL(warning) << "Transfer engine: Buffer limit reached while receiving: " << chunk.filename;
    throw TransferError("session buffer limit of " + std::to_string(buffer_limit_) + " bytes exceeded");
  }

  if (it == uploads_.end()) {
    BOOST_LOG_TRIVIAL(debug) << "Transfer engine: New upload " << chunk.filename
                             << " with " << chunk.total_chunks << " chunks";
    it = uploads_.emplace(chunk.filename, Upload{}).first;
    it->second.total_chunks = chunk.total_chunks;
  }

  Upload& upload = it->second;
  upload.bytes = upload.bytes - replaced + chunk.data.size();
  upload.chunks[chunk.chunk_index] = chunk.data;
  buffered_bytes_ = projected;

  BOOST_LOG_TRIVIAL(trace) << "Transfer engine: Chunk " << chunk.chunk_index + 1 << "/" << upload.total_chunks
                           << " of " << chunk.filename;
  return upload.is_complete();
}

store::FileMetadata TransferEngine::complete(const std::string& filename) {
  auto it = uploads_.find(filename);
  if (it == uploads_.end()) {
    throw TransferError("no upload in progress for " + filename);
  }

  if (!it->second.is_complete()) {
    std::size_t missing = it->second.total_chunks - it->second.chunks.size();
    BOOST_LOG_TRIVIAL(warning) << "Transfer engine: Completion refused, " << missing
                               << " chunks missing for: " << filename;
    throw TransferError(std::to_string(missing) + " of " + std::to_string(it->second.total_chunks)
                        + " chunks missing");
  }

  Upload upload = std::move(it->second);
  uploads_.erase(it);
  buffered_bytes_ -= upload.bytes;

  // std::map iterates in index order
  std::vector<uint8_t> content;
  content.reserve(upload.bytes);
  for (auto& [index, data] : upload.chunks) {
    content.insert(content.end(), data.begin(), data.end());
  }
  upload.chunks.clear();

  BOOST_LOG_TRIVIAL(info) << "Transfer engine: Committing " << content.size() << " bytes for: " << filename;
  return store_.put(filename, content);
}

void TransferEngine::abandon_all() {
  for (const auto& [filename, upload] : uploads_) {
    BOOST_LOG_TRIVIAL(info) << "Transfer engine: Discarding incomplete upload " << filename << " ("
                            << upload.chunks.size() << "/" << upload.total_chunks << " chunks)";
  }
  uploads_.clear();
  buffered_bytes_ = 0;
}


//==============================================
// DOWNLOADS
//==============================================

protocol::ChunkPayload TransferEngine::retrieve_chunk(const std::string& filename, uint32_t chunk_index) const {
  uint64_t begin = static_cast<uint64_t>(chunk_index) * protocol::CHUNK_SIZE;
  store::FileSlice slice = store_.read_range(filename, begin, protocol::CHUNK_SIZE);

  // Size and bytes come from one locked read
  uint32_t total = protocol::chunk_count(slice.file_size);
  if (chunk_index >= total) {
    throw TransferError("chunk index " + std::to_string(chunk_index)
                        + " out of range for " + std::to_string(total) + " chunks");
  }

  protocol::ChunkPayload chunk;
  chunk.filename = filename;
  chunk.chunk_index = chunk_index;
  chunk.total_chunks = total;
  chunk.data = std::move(slice.data);

  BOOST_LOG_TRIVIAL(debug) << "Transfer engine: Serving chunk " << chunk_index + 1 << "/" << total
                           << " of " << filename;
  return chunk;
}


//==============================================
// QUERY METHODS
//==============================================

bool TransferEngine::has_upload(const std::string& filename) const {
  return uploads_.find(filename) != uploads_.end();
}

} // namespace transfer
} // namespace netbackup
