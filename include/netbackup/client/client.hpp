#ifndef NETBACKUP_CLIENT_CLIENT_HPP
#define NETBACKUP_CLIENT_CLIENT_HPP

#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <boost/asio.hpp>
#include "netbackup/protocol/codec.hpp"
#include "netbackup/protocol/message_frame.hpp"
#include "netbackup/store/file_metadata.hpp"

namespace netbackup {
namespace client {

// Raised for transport failures and for error responses from the server.
// status() is set only in the second case.
class ClientError : public std::runtime_error {
public:
  explicit ClientError(const std::string& message)
    : std::runtime_error(message) {}

  ClientError(protocol::StatusCode status, const std::string& reason)
    : std::runtime_error(std::string(protocol::status_to_string(status)) + ": " + reason)
    , status_(status)
    , reason_(reason) {}

  std::optional<protocol::StatusCode> status() const { return status_; }
  const std::string& reason() const { return reason_; }

private:
  std::optional<protocol::StatusCode> status_;
  std::string reason_;
};

// Synchronous protocol client over one TCP connection
class Client {
public:
  // Invoked after each chunk with (chunks_done, total_chunks)
  using ProgressCallback = std::function<void(uint32_t, uint32_t)>;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit Client(const std::string& password);
  ~Client();

  Client(const Client&) = delete;
  Client& operator=(const Client&) = delete;


  // ---- CONNECTION ----
  void connect(const std::string& host, uint16_t port);
  void disconnect();
  bool is_connected() const { return socket_.is_open(); }
  // Sends AUTH, throws ClientError with PERMISSION_DENIED on a bad password
  void authenticate();


  // ---- CHUNKED TRANSFERS ----
  // Sends local_path as StoreChunk 0..n-1 followed by StoreComplete
  void upload(const std::string& local_path, const std::string& remote_name,
              const ProgressCallback& progress = nullptr);
  // Fetches remote_name chunk by chunk and writes it to local_path atomically
  void download(const std::string& remote_name, const std::string& local_path,
                const ProgressCallback& progress = nullptr);


  // ---- SINGLE-MESSAGE OPERATIONS ----
  // Legacy store, limited to one chunk of data
  void store(const std::string& remote_name, const std::vector<uint8_t>& data);
  std::vector<uint8_t> retrieve(const std::string& remote_name);
  std::vector<store::FileMetadata> list();
  void remove(const std::string& remote_name);


  // ---- LOW LEVEL ----
  // Sends one request and returns the verified response. Throws ClientError
  // unless the response status is SUCCESS.
  protocol::MessageFrame request(protocol::OpCode op_code, std::vector<uint8_t> payload);

private:
  // ---- PARAMETERS ----
  const protocol::Digest auth_token_;
  uint32_t next_request_id_ = 1;

  // Network components
  boost::asio::io_context io_context_;
  boost::asio::ip::tcp::socket socket_;
  protocol::Codec codec_;


  // ---- FRAME I/O ----
  void send_frame(const protocol::MessageFrame& frame);
  protocol::MessageFrame receive_frame();
};

} // namespace client
} // namespace netbackup

#endif // NETBACKUP_CLIENT_CLIENT_HPP
