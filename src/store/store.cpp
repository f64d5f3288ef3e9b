#include "netbackup/store/store.hpp"
#include "netbackup/crypto/integrity.hpp"
#include "netbackup/protocol/message_frame.hpp"
#include <boost/log/trivial.hpp>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>
#include <system_error>

namespace netbackup {
namespace store {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Store::Store(const std::string& base_path) : base_path_(base_path) {
  BOOST_LOG_TRIVIAL(info) << "Store: Initializing Store with base path: " << base_path;
  try {
    check_directory_exists(base_path_);
  } catch (const std::filesystem::filesystem_error& e) {
    throw StoreError("Store: Failed to create storage directory: " + std::string(e.what()));
  }
  remove_stale_temporaries();
  BOOST_LOG_TRIVIAL(debug) << "Store: Store directory created/verified at: " << base_path;
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

FileMetadata Store::put(const std::string& filename, const std::vector<uint8_t>& data) {
  std::filesystem::path file_path = resolve_path(filename);
  BOOST_LOG_TRIVIAL(info) << "Store: Storing " << data.size() << " bytes as: " << filename;

  auto guard = locks_.lock_exclusive(filename);
  check_directory_exists(base_path_);

  std::filesystem::path temp_path = make_temp_path();
  {
    std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
    if (!file) {
      throw StoreError("Store: Failed to create file: " + temp_path.string());
    }
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    file.flush();
    if (!file) {
      file.close();
      std::error_code ec;
      std::filesystem::remove(temp_path, ec);
      BOOST_LOG_TRIVIAL(error) << "Store: Write failed for: " << filename;
      throw StoreError("Store: Failed to write file: " + filename);
    }
  }

  // Contents must be durable before the name points at them
  try {
    sync_path(temp_path);
  } catch (const StoreError&) {
    std::error_code cleanup_ec;
    std::filesystem::remove(temp_path, cleanup_ec);
    throw;
  }

  // rename() replaces the destination in one step on POSIX
  std::error_code ec;
  std::filesystem::rename(temp_path, file_path, ec);
  if (ec) {
    std::error_code cleanup_ec;
    std::filesystem::remove(temp_path, cleanup_ec);
    BOOST_LOG_TRIVIAL(error) << "Store: Rename failed for " << filename << ": " << ec.message();
    throw StoreError("Store: Failed to commit file: " + filename);
  }

  try {
    sync_path(base_path_);
  } catch (const StoreError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Store: Directory sync after commit failed: " << e.what();
  }

  FileMetadata metadata = read_metadata(file_path, filename);
  metadata.checksum = crypto::checksum(data);
  BOOST_LOG_TRIVIAL(info) << "Store: Successfully stored " << metadata.size << " bytes as: " << filename;
  return metadata;
}

StoredFile Store::get(const std::string& filename) const {
  std::filesystem::path file_path = resolve_path(filename);
  BOOST_LOG_TRIVIAL(info) << "Store: Retrieving data for: " << filename;

  auto guard = locks_.lock_shared(filename);

  std::error_code ec;
  if (!std::filesystem::is_regular_file(file_path, ec)) {
    BOOST_LOG_TRIVIAL(debug) << "Store: File not found: " << filename;
    throw FileNotFoundError(filename);
  }

  StoredFile stored;
  stored.data = read_file(file_path);
  stored.metadata = read_metadata(file_path, filename);
  stored.metadata.checksum = crypto::checksum(stored.data);

  BOOST_LOG_TRIVIAL(info) << "Store: Successfully read " << stored.data.size() << " bytes for: " << filename;
  return stored;
}

FileSlice Store::read_range(const std::string& filename, uint64_t offset, std::size_t length) const {
  std::filesystem::path file_path = resolve_path(filename);

  auto guard = locks_.lock_shared(filename);

  std::error_code ec;
  if (!std::filesystem::is_regular_file(file_path, ec)) {
    BOOST_LOG_TRIVIAL(debug) << "Store: File not found: " << filename;
    throw FileNotFoundError(filename);
  }

  std::ifstream file(file_path, std::ios::binary | std::ios::ate);
  if (!file) {
    throw StoreError("Store: Failed to open file: " + file_path.string());
  }

  FileSlice slice;
  slice.file_size = static_cast<uint64_t>(file.tellg());
  if (offset >= slice.file_size) {
    return slice;
  }

  std::size_t count = static_cast<std::size_t>(std::min<uint64_t>(length, slice.file_size - offset));
  slice.data.resize(count);
  file.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
  if (count > 0 && !file.read(reinterpret_cast<char*>(slice.data.data()), static_cast<std::streamsize>(count))) {
    throw StoreError("Store: Failed to read file: " + file_path.string());
  }

  BOOST_LOG_TRIVIAL(trace) << "Store: Read " << count << " bytes at offset " << offset << " of: " << filename;
  return slice;
}

void Store::remove(const std::string& filename) {
  std::filesystem::path file_path = resolve_path(filename);
  BOOST_LOG_TRIVIAL(info) << "Store: Removing file: " << filename;

  auto guard = locks_.lock_exclusive(filename);

  std::error_code ec;
  if (!std::filesystem::is_regular_file(file_path, ec)) {
    throw FileNotFoundError(filename);
  }

  if (!std::filesystem::remove(file_path, ec) || ec) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to remove file " << filename << ": " << ec.message();
    throw StoreError("Store: Failed to remove file: " + filename);
  }
  BOOST_LOG_TRIVIAL(info) << "Store: Successfully removed file: " << filename;
}

void Store::clear() {
  BOOST_LOG_TRIVIAL(info) << "Store: Clearing entire store at: " << base_path_;
  std::error_code ec;
  std::filesystem::remove_all(base_path_, ec);
  if (ec) {
    throw StoreError("Store: Failed to clear store: " + ec.message());
  }
  check_directory_exists(base_path_);
  BOOST_LOG_TRIVIAL(info) << "Store: Store cleared successfully";
}


//==============================================
// QUERY OPERATIONS
//==============================================

std::vector<FileMetadata> Store::list() const {
  BOOST_LOG_TRIVIAL(debug) << "Store: Listing contents of: " << base_path_;

  std::vector<std::string> names;
  std::error_code ec;
  for (std::filesystem::directory_iterator it(base_path_, ec), end; !ec && it != end; it.increment(ec)) {
    if (!it->is_regular_file()) {
      continue;
    }
    std::string name = it->path().filename().string();
    if (name.rfind(TEMP_PREFIX, 0) == 0) {
      continue;
    }
    names.push_back(std::move(name));
  }
  if (ec) {
    throw StoreError("Store: Failed to list directory: " + ec.message());
  }

  std::sort(names.begin(), names.end());

  std::vector<FileMetadata> files;
  files.reserve(names.size());
  for (const auto& name : names) {
    try {
      validate_filename(name);
    } catch (const InvalidFilenameError&) {
      continue;
    }

    auto guard = locks_.lock_shared(name);
    std::filesystem::path file_path = base_path_ / name;
    // Deleted between the scan and the lock
    if (!std::filesystem::is_regular_file(file_path, ec)) {
      continue;
    }

    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
      throw StoreError("Store: Failed to open file: " + file_path.string());
    }
    crypto::Sha256 hasher;
    hasher.update(file);

    FileMetadata metadata = read_metadata(file_path, name);
    metadata.checksum = hasher.finalize();
    files.push_back(std::move(metadata));
  }

  BOOST_LOG_TRIVIAL(debug) << "Store: Listed " << files.size() << " files";
  return files;
}

bool Store::has(const std::string& filename) const {
  std::filesystem::path file_path = resolve_path(filename);
  std::error_code ec;
  bool exists = std::filesystem::is_regular_file(file_path, ec);
  BOOST_LOG_TRIVIAL(debug) << "Store: " << filename << (exists ? " exists" : " not found");
  return exists;
}

void Store::validate_filename(const std::string& filename) {
  if (filename.empty()) {
    throw InvalidFilenameError("filename is empty");
  }
  if (filename.size() > protocol::MAX_FILENAME_LENGTH) {
    throw InvalidFilenameError("filename exceeds " + std::to_string(protocol::MAX_FILENAME_LENGTH) + " bytes");
  }
  if (filename == "." || filename == "..") {
    throw InvalidFilenameError("'" + filename + "' is not a file");
  }
  if (filename.find_first_of(std::string("/\\\0", 3)) != std::string::npos) {
    throw InvalidFilenameError("filename contains a path separator or NUL");
  }
  if (filename.rfind(TEMP_PREFIX, 0) == 0) {
    throw InvalidFilenameError("filename uses a reserved prefix");
  }
}


//==============================================
// UTILITY METHODS
//==============================================

void Store::check_directory_exists(const std::filesystem::path& path) const {
  if (!std::filesystem::exists(path)) {
    std::filesystem::create_directories(path);
  }
}

std::filesystem::path Store::resolve_path(const std::string& filename) const {
  try {
    validate_filename(filename);
  } catch (const InvalidFilenameError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Store: Rejected filename: " << e.what();
    throw;
  }
  return base_path_ / filename;
}

std::filesystem::path Store::make_temp_path() const {
  thread_local std::mt19937_64 generator(std::random_device{}());

  std::stringstream ss;
  ss << TEMP_PREFIX << std::hex << std::setw(16) << std::setfill('0') << generator();
  return base_path_ / ss.str();
}

FileMetadata Store::read_metadata(const std::filesystem::path& file_path, const std::string& filename) const {
  struct stat info {};
  if (::stat(file_path.c_str(), &info) != 0) {
    throw StoreError("Store: Failed to stat file: " + file_path.string());
  }

  FileMetadata metadata;
  metadata.filename = filename;
  metadata.size = static_cast<uint64_t>(info.st_size);
  metadata.modified_time = static_cast<uint64_t>(info.st_mtime);
  return metadata;
}

std::vector<uint8_t> Store::read_file(const std::filesystem::path& file_path) const {
  std::ifstream file(file_path, std::ios::binary | std::ios::ate);
  if (!file) {
    throw StoreError("Store: Failed to open file: " + file_path.string());
  }

  std::streamsize size = file.tellg();
  file.seekg(0, std::ios::beg);

  std::vector<uint8_t> data(static_cast<std::size_t>(size));
  if (size > 0 && !file.read(reinterpret_cast<char*>(data.data()), size)) {
    throw StoreError("Store: Failed to read file: " + file_path.string());
  }
  return data;
}

void Store::sync_path(const std::filesystem::path& path) const {
  int fd = ::open(path.c_str(), O_RDONLY);
  if (fd < 0) {
    throw StoreError("Store: Failed to open for sync: " + path.string());
  }
  int result = ::fsync(fd);
  ::close(fd);
  if (result != 0) {
    BOOST_LOG_TRIVIAL(error) << "Store: fsync failed for: " << path;
    throw StoreError("Store: Failed to sync: " + path.string());
  }
}

void Store::remove_stale_temporaries() {
  std::error_code ec;
  for (std::filesystem::directory_iterator it(base_path_, ec), end; !ec && it != end; it.increment(ec)) {
    std::string name = it->path().filename().string();
    if (name.rfind(TEMP_PREFIX, 0) != 0) {
      continue;
    }
    std::error_code remove_ec;
    std::filesystem::remove(it->path(), remove_ec);
    if (remove_ec) {
      BOOST_LOG_TRIVIAL(warning) << "Store: Could not remove stale temporary " << name << ": " << remove_ec.message();
    } else {
      BOOST_LOG_TRIVIAL(info) << "Store: Removed stale temporary: " << name;
    }
  }
}

} // namespace store
} // namespace netbackup
