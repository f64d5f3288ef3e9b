#include "netbackup/client/client.hpp"
#include "netbackup/crypto/integrity.hpp"
#include "netbackup/protocol/payload.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <array>
#include <filesystem>
#include <fstream>

namespace netbackup {
namespace client {

using protocol::MessageFrame;
using protocol::OpCode;

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Client::Client(const std::string& password)
  : auth_token_(crypto::derive_token(password))
  , socket_(io_context_)
  , codec_(protocol::MAX_RESPONSE_FRAME_LENGTH) {
}

Client::~Client() {
  disconnect();
}


//==============================================
// CONNECTION
//==============================================

void Client::connect(const std::string& host, uint16_t port) {
  disconnect();

  try {
    BOOST_LOG_TRIVIAL(debug) << "Client: Resolving " << host << ":" << port;
    boost::asio::ip::tcp::resolver resolver(io_context_);
    auto endpoints = resolver.resolve(host, std::to_string(port));

    boost::asio::connect(socket_, endpoints);
    BOOST_LOG_TRIVIAL(info) << "Client: Connected to " << host << ":" << port;
  }
  catch (const boost::system::system_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Client: Connection to " << host << ":" << port << " failed: " << e.what();
    boost::system::error_code ec;
    socket_.close(ec);
    throw ClientError("Failed to connect to " + host + ":" + std::to_string(port) + ": " + e.code().message());
  }
}

void Client::disconnect() {
  codec_.reset();
  if (!socket_.is_open()) {
    return;
  }

  boost::system::error_code ec;
  socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
  socket_.close(ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(debug) << "Client: Socket close error: " << ec.message();
  }
  BOOST_LOG_TRIVIAL(debug) << "Client: Disconnected";
}

void Client::authenticate() {
  request(OpCode::AUTH, {});
  BOOST_LOG_TRIVIAL(info) << "Client: Authenticated";
}


//==============================================
// CHUNKED TRANSFERS
//==============================================

void Client::upload(const std::string& local_path, const std::string& remote_name,
                    const ProgressCallback& progress) {
  std::error_code ec;
  uint64_t size = std::filesystem::file_size(local_path, ec);
  if (ec) {
    throw ClientError("Cannot read " + local_path + ": " + ec.message());
  }

  std::ifstream file(local_path, std::ios::binary);
  if (!file) {
    throw ClientError("Cannot open " + local_path);
  }

  uint32_t total_chunks = protocol::chunk_count(size);
  BOOST_LOG_TRIVIAL(info) << "Client: Uploading " << local_path << " (" << size << " bytes) as "
                          << remote_name << " in " << total_chunks << " chunks";

  protocol::ChunkPayload chunk;
  chunk.filename = remote_name;
  chunk.total_chunks = total_chunks;

  uint64_t remaining = size;
  for (uint32_t index = 0; index < total_chunks; ++index) {
    std::size_t length = static_cast<std::size_t>(std::min<uint64_t>(remaining, protocol::CHUNK_SIZE));
    chunk.chunk_index = index;
    chunk.data.resize(length);
    if (length > 0 && !file.read(reinterpret_cast<char*>(chunk.data.data()), static_cast<std::streamsize>(length))) {
      throw ClientError("Failed to read " + local_path + " at chunk " + std::to_string(index));
    }
    remaining -= length;

    request(OpCode::STORE_CHUNK, protocol::encode_chunk(chunk));
    if (progress) {
      progress(index + 1, total_chunks);
    }
  }

  MessageFrame response = request(OpCode::STORE_COMPLETE, protocol::encode_filename(remote_name));
  BOOST_LOG_TRIVIAL(info) << "Client: Upload complete: " << protocol::to_text(response.payload);
}

void Client::download(const std::string& remote_name, const std::string& local_path,
                      const ProgressCallback& progress) {
  std::filesystem::path target(local_path);
  std::filesystem::path temp_path = target;
  temp_path += ".part";

  std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
  if (!file) {
    throw ClientError("Cannot create " + temp_path.string());
  }

  try {
    protocol::ChunkPayload query;
    query.filename = remote_name;

    uint32_t total_chunks = 1;
    for (uint32_t index = 0; index < total_chunks; ++index) {
      query.chunk_index = index;
      MessageFrame response = request(OpCode::RETRIEVE_CHUNK, protocol::encode_chunk(query, false));
      protocol::ChunkPayload chunk = protocol::decode_chunk(response.payload);

      if (chunk.chunk_index != index || chunk.filename != remote_name) {
        throw ClientError("Server answered with chunk " + std::to_string(chunk.chunk_index)
                          + " of " + chunk.filename);
      }
      if (index == 0) {
        total_chunks = chunk.total_chunks;
      } else if (chunk.total_chunks != total_chunks) {
        throw ClientError(remote_name + " changed during download");
      }

      file.write(reinterpret_cast<const char*>(chunk.data.data()), static_cast<std::streamsize>(chunk.data.size()));
      if (!file) {
        throw ClientError("Failed to write " + temp_path.string());
      }
      if (progress) {
        progress(index + 1, total_chunks);
      }
    }

    file.close();
    if (!file) {
      throw ClientError("Failed to write " + temp_path.string());
    }
    std::filesystem::rename(temp_path, target);
  }
  catch (const std::exception&) {
    file.close();
    std::error_code ec;
    std::filesystem::remove(temp_path, ec);
    throw;
  }

  BOOST_LOG_TRIVIAL(info) << "Client: Downloaded " << remote_name << " to " << local_path;
}


//==============================================
// SINGLE-MESSAGE OPERATIONS
//==============================================

void Client::store(const std::string& remote_name, const std::vector<uint8_t>& data) {
  if (data.size() > protocol::CHUNK_SIZE) {
    throw ClientError("Single-message store is limited to " + std::to_string(protocol::CHUNK_SIZE)
                      + " bytes, use upload");
  }
  request(OpCode::STORE, protocol::encode_store({remote_name, data}));
}

std::vector<uint8_t> Client::retrieve(const std::string& remote_name) {
  return request(OpCode::RETRIEVE, protocol::encode_filename(remote_name)).payload;
}

std::vector<store::FileMetadata> Client::list() {
  return protocol::decode_listing(request(OpCode::LIST, {}).payload);
}

void Client::remove(const std::string& remote_name) {
  request(OpCode::DELETE, protocol::encode_filename(remote_name));
}


//==============================================
// LOW LEVEL
//==============================================

MessageFrame Client::request(OpCode op_code, std::vector<uint8_t> payload) {
  if (!socket_.is_open()) {
    throw ClientError("Not connected");
  }

  MessageFrame frame;
  frame.request_id = next_request_id_++;
  frame.op_code = op_code;
  frame.auth_token = auth_token_;
  frame.payload = std::move(payload);
  crypto::seal(frame);

  send_frame(frame);
  MessageFrame response = receive_frame();

  if (response.request_id != frame.request_id || response.op_code != frame.op_code) {
    disconnect();
    throw ClientError("Response " + std::to_string(response.request_id) + " does not answer request "
                      + std::to_string(frame.request_id));
  }
  try {
    crypto::verify_integrity(response);
  }
  catch (const crypto::IntegrityError& e) {
    throw ClientError(std::string("Corrupted response: ") + e.what());
  }

  if (response.status != protocol::StatusCode::SUCCESS) {
    std::string reason = protocol::to_text(response.payload);
    BOOST_LOG_TRIVIAL(debug) << "Client: " << protocol::op_code_to_string(op_code) << " failed: " << reason;
    throw ClientError(response.status, reason);
  }
  return response;
}


//==============================================
// FRAME I/O
//==============================================

void Client::send_frame(const MessageFrame& frame) {
  std::vector<uint8_t> bytes;
  try {
    bytes = protocol::Codec::encode(frame, protocol::MAX_PAYLOAD_SIZE);
  }
  catch (const protocol::ProtocolError& e) {
    throw ClientError(e.what());
  }

  boost::system::error_code ec;
  boost::asio::write(socket_, boost::asio::buffer(bytes), ec);
  if (ec) {
    disconnect();
    throw ClientError("Send failed: " + ec.message());
  }
}

MessageFrame Client::receive_frame() {
  std::array<uint8_t, 8192> buffer;
  MessageFrame frame;

  try {
    while (codec_.decode(frame) == protocol::Codec::DecodeStatus::NEED_MORE_DATA) {
      boost::system::error_code ec;
      std::size_t bytes_read = socket_.read_some(boost::asio::buffer(buffer), ec);
      if (ec == boost::asio::error::eof) {
        disconnect();
        throw ClientError("Connection closed by server");
      }
      if (ec) {
        disconnect();
        throw ClientError("Receive failed: " + ec.message());
      }
      codec_.feed(buffer.data(), bytes_read);
    }
  }
  catch (const protocol::MalformedFrameError& e) {
    disconnect();
    throw ClientError(e.what());
  }
  return frame;
}

} // namespace client
} // namespace netbackup
