#ifndef NETBACKUP_NETWORK_SESSION_HPP
#define NETBACKUP_NETWORK_SESSION_HPP

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <boost/asio.hpp>
#include "netbackup/network/request_handler.hpp"
#include "netbackup/protocol/codec.hpp"

namespace netbackup {
namespace network {

// One accepted connection served by its own thread with blocking I/O.
// Requests are answered strictly in arrival order.
class Session {
public:
  // Delete copy operations to prevent socket duplication
  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Session(uint64_t session_id, boost::asio::ip::tcp::socket socket,
          store::Store& store, const protocol::Digest& auth_token);
  ~Session();


  // ---- LIFECYCLE ----
  // Spawns the processing thread
  bool start();
  // Closes the socket, which unblocks the thread, then joins it
  void stop();
  // False once the peer disconnected or the session was stopped
  bool is_active() const { return active_; }


  // ---- GETTERS ----
  uint64_t get_session_id() const { return session_id_; }
  const std::string& get_remote_endpoint() const { return remote_endpoint_; }

private:
  // ---- PARAMETERS ----
  const uint64_t session_id_;
  std::string remote_endpoint_;

  boost::asio::ip::tcp::socket socket_;
  protocol::Codec codec_;
  RequestHandler handler_;

  std::unique_ptr<std::thread> processing_thread_;
  std::atomic<bool> active_{false};
  std::atomic<bool> stopping_{false};
  std::atomic<bool> shutdown_issued_{false};


  // ---- PROCESSING ----
  // Read, decode, handle and answer until the connection ends
  void process_stream();
  // Serializes and writes one response, false on socket error
  bool send_frame(const protocol::MessageFrame& frame);


  // ---- TEARDOWN ----
  void cleanup_connection();
  // Shuts the socket down once, false if another caller already did
  bool shutdown_socket();
};

} // namespace network
} // namespace netbackup

#endif // NETBACKUP_NETWORK_SESSION_HPP
