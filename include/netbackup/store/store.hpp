#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>
#include "netbackup/store/file_metadata.hpp"
#include "netbackup/store/lock_table.hpp"

namespace netbackup {
namespace store {

// Prefix reserved for in-flight writes inside the storage directory
constexpr const char* TEMP_PREFIX = ".netbackup-tmp-";

// Committed content together with the metadata computed from it
struct StoredFile {
  std::vector<uint8_t> data;
  FileMetadata metadata;
};

// A byte range of a committed file and the file's size when it was read
struct FileSlice {
  std::vector<uint8_t> data;
  uint64_t file_size = 0;
};

class Store {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Creates base_path if needed and removes temporaries left by a crash
  explicit Store(const std::string& base_path);


  // ---- CORE STORAGE OPERATIONS ----
  // Atomically replaces filename with data
  FileMetadata put(const std::string& filename, const std::vector<uint8_t>& data);
  // Reads the whole file, throws FileNotFoundError if absent
  StoredFile get(const std::string& filename) const;
  // Reads at most length bytes from offset without hashing the file.
  // An offset at or past the end yields an empty slice.
  FileSlice read_range(const std::string& filename, uint64_t offset, std::size_t length) const;
  // Deletes filename, throws FileNotFoundError if absent
  void remove(const std::string& filename);
  // Removes all stored data and reset store
  void clear();


  // ---- QUERY OPERATIONS ----
  // Every committed file, sorted by filename
  std::vector<FileMetadata> list() const;
  bool has(const std::string& filename) const;
  const std::filesystem::path& base_path() const { return base_path_; }

  // Throws InvalidFilenameError unless filename is a single safe segment
  static void validate_filename(const std::string& filename);

private:
  // ---- PARAMETERS ----
  // Root path for all stored files
  std::filesystem::path base_path_;
  // Serializes writers per filename
  mutable LockTable locks_;


  // ---- UTILITY METHODS ----
  // Ensures directory exists, create if needed
  void check_directory_exists(const std::filesystem::path& path) const;
  // Validates filename, then joins it to the base path
  std::filesystem::path resolve_path(const std::string& filename) const;
  // Unique temporary path next to the committed files
  std::filesystem::path make_temp_path() const;
  // Size and mtime from the file system, checksum left to the caller
  FileMetadata read_metadata(const std::filesystem::path& file_path, const std::string& filename) const;
  std::vector<uint8_t> read_file(const std::filesystem::path& file_path) const;
  // Flushes file contents (or a directory entry) to stable storage
  void sync_path(const std::filesystem::path& path) const;
  void remove_stale_temporaries();
};

class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

class InvalidFilenameError : public StoreError {
public:
  explicit InvalidFilenameError(const std::string& message)
    : StoreError("Invalid filename: " + message) {}
};

class FileNotFoundError : public StoreError {
public:
  explicit FileNotFoundError(const std::string& filename)
    : StoreError("File not found: " + filename) {}
};

} // namespace store
} // namespace netbackup
