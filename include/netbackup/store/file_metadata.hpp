#ifndef NETBACKUP_STORE_FILE_METADATA_HPP
#define NETBACKUP_STORE_FILE_METADATA_HPP

#include <array>
#include <cstdint>
#include <string>

namespace netbackup {
namespace store {

// Description of one committed file in the namespace
struct FileMetadata {
  std::string filename;
  uint64_t size = 0;
  // Seconds since the Unix epoch
  uint64_t modified_time = 0;
  std::array<uint8_t, 32> checksum{};
};

inline bool operator==(const FileMetadata& lhs, const FileMetadata& rhs) {
  return lhs.filename == rhs.filename
      && lhs.size == rhs.size
      && lhs.modified_time == rhs.modified_time
      && lhs.checksum == rhs.checksum;
}

} // namespace store
} // namespace netbackup

#endif // NETBACKUP_STORE_FILE_METADATA_HPP
