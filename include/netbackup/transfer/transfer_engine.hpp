#ifndef NETBACKUP_TRANSFER_TRANSFER_ENGINE_HPP
#define NETBACKUP_TRANSFER_TRANSFER_ENGINE_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>
#include "netbackup/protocol/payload.hpp"
#include "netbackup/store/store.hpp"

namespace netbackup {
namespace transfer {

// Upper bound on chunk bytes one session may hold before StoreComplete
constexpr std::size_t DEFAULT_SESSION_BUFFER_LIMIT = 256 * 1024 * 1024;

class TransferError : public std::runtime_error {
public:
  explicit TransferError(const std::string& message)
    : std::runtime_error("Transfer error: " + message) {}
};

// Chunked upload reassembly and download slicing for one session.
// Not thread safe: a session processes its requests in order on one thread.
class TransferEngine {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit TransferEngine(store::Store& store, std::size_t buffer_limit = DEFAULT_SESSION_BUFFER_LIMIT);
  // Discards every upload that never completed
  ~TransferEngine();

  TransferEngine(const TransferEngine&) = delete;
  TransferEngine& operator=(const TransferEngine&) = delete;


  // ---- UPLOADS ----
  // Buffers one chunk; returns true once every index of the upload is present.
  // A rejected chunk leaves the upload as it was.
  bool store_chunk(const protocol::ChunkPayload& chunk);
  // Commits a fully received upload through the store. The upload is
  // discarded whether or not the commit succeeds.
  store::FileMetadata complete(const std::string& filename);
  void abandon_all();


  // ---- DOWNLOADS ----
  // Slice chunk_index of the committed file, with total_chunks filled in
  protocol::ChunkPayload retrieve_chunk(const std::string& filename, uint32_t chunk_index) const;


  // ---- QUERY METHODS ----
  bool has_upload(const std::string& filename) const;
  std::size_t pending_uploads() const { return uploads_.size(); }
  std::size_t buffered_bytes() const { return buffered_bytes_; }

private:
  struct Upload {
    uint32_t total_chunks = 0;
    std::map<uint32_t, std::vector<uint8_t>> chunks;
    std::size_t bytes = 0;

    bool is_complete() const { return chunks.size() == total_chunks; }
  };

  store::Store& store_;
  std::size_t buffer_limit_;
  std::size_t buffered_bytes_ = 0;
  std::unordered_map<std::string, Upload> uploads_;
};

} // namespace transfer
} // namespace netbackup

#endif // NETBACKUP_TRANSFER_TRANSFER_ENGINE_HPP
