#ifndef NETBACKUP_PROTOCOL_BYTE_ORDER_HPP
#define NETBACKUP_PROTOCOL_BYTE_ORDER_HPP

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>
#include <boost/endian/conversion.hpp>
#include "netbackup/protocol/protocol_error.hpp"

namespace netbackup::protocol {

// Appends integers in network byte order (big endian) to a byte buffer
class ByteWriter {
public:
  explicit ByteWriter(std::vector<uint8_t>& output) : output_(output) {}

  template<typename T>
  void write_int(T value) {
    T network_value = boost::endian::native_to_big(value);
    write_bytes(&network_value, sizeof(network_value));
  }

  void write_u8(uint8_t value) { output_.push_back(value); }

  void write_bytes(const void* data, std::size_t size) {
    const auto* bytes = static_cast<const uint8_t*>(data);
    output_.insert(output_.end(), bytes, bytes + size);
  }

  // Length-prefixed (u32) byte string
  void write_sized(const void* data, std::size_t size) {
    write_int(static_cast<uint32_t>(size));
    write_bytes(data, size);
  }

  void write_string(const std::string& value) {
    write_sized(value.data(), value.size());
  }

private:
  std::vector<uint8_t>& output_;
};

// Reads network ordered integers from a byte range, throws PayloadError on underrun
class ByteReader {
public:
  ByteReader(const uint8_t* data, std::size_t size)
    : data_(data), size_(size), offset_(0) {}

  explicit ByteReader(const std::vector<uint8_t>& data)
    : ByteReader(data.data(), data.size()) {}

  template<typename T>
  T read_int() {
    T network_value;
    read_bytes(&network_value, sizeof(network_value));
    return boost::endian::big_to_native(network_value);
  }

  uint8_t read_u8() {
    uint8_t value;
    read_bytes(&value, sizeof(value));
    return value;
  }

  void read_bytes(void* out, std::size_t size) {
    require(size);
    std::memcpy(out, data_ + offset_, size);
    offset_ += size;
  }

  // Reads a u32 length prefix, checks it against max_size, then the bytes
  std::vector<uint8_t> read_sized(std::size_t max_size) {
    uint32_t size = read_int<uint32_t>();
    if (size > max_size) {
      throw PayloadError("length " + std::to_string(size) + " exceeds limit " + std::to_string(max_size));
    }
    require(size);
    std::vector<uint8_t> bytes(data_ + offset_, data_ + offset_ + size);
    offset_ += size;
    return bytes;
  }

  std::string read_string(std::size_t max_size) {
    std::vector<uint8_t> bytes = read_sized(max_size);
    return std::string(bytes.begin(), bytes.end());
  }

  std::size_t remaining() const { return size_ - offset_; }

private:
  const uint8_t* data_;
  std::size_t size_;
  std::size_t offset_;

  void require(std::size_t size) const {
    if (size > size_ - offset_) {
      throw PayloadError("truncated, needed " + std::to_string(size) +
                         " bytes but only " + std::to_string(size_ - offset_) + " remain");
    }
  }
};

} // namespace netbackup::protocol

#endif // NETBACKUP_PROTOCOL_BYTE_ORDER_HPP
