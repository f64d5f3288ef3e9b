#pragma once

#include <boost/asio.hpp>
#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include "netbackup/network/session.hpp"
#include "netbackup/protocol/message_frame.hpp"
#include "netbackup/store/store.hpp"

namespace netbackup {
namespace network {

class TCP_Server {
public:

  // -- CONSTRUCTOR AND DESTRUCTOR ----
  // Port 0 binds an ephemeral port, see get_port()
  TCP_Server(const std::string& address, uint16_t port, store::Store& store, const protocol::Digest& auth_token);
  ~TCP_Server();

  TCP_Server(const TCP_Server&) = delete;
  TCP_Server& operator=(const TCP_Server&) = delete;


  // ---- INITIALIZATION AND TEARDOWN ----
  bool start_listener();
  // Stops accepting, then closes every session and joins its thread
  void shutdown();


  // ---- GETTERS ----
  // Bound port once listening, the configured port before
  uint16_t get_port() const { return port_; }
  const std::string& get_address() const { return address_; }
  bool is_running() const { return is_running_; }
  // Sessions whose connection is still open
  std::size_t active_sessions() const;

private:

  // ---- PARAMETERS ----
  // Network Parameters
  std::atomic<uint16_t> port_;
  const std::string address_;

  // System components
  store::Store& store_;
  const protocol::Digest auth_token_;

  // Server state
  std::unique_ptr<std::thread> io_thread_;
  std::atomic<bool> is_running_{false};

  // Incoming connection handlers
  boost::asio::io_context io_context_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;

  // Live sessions keyed by id, declared after io_context_ so they close first
  mutable std::mutex sessions_mutex_;
  std::map<uint64_t, std::unique_ptr<Session>> sessions_;
  uint64_t next_session_id_ = 1;


  // ---- INITIALIZATION AND TEARDOWN ----
  // Main listening loop that handles incoming connections
  void start_accept();
  // Hands an accepted socket to a new session
  void create_session(boost::asio::ip::tcp::socket socket);
  // Joins and drops sessions whose connection already ended
  void reap_finished_sessions();
};

} // namespace network
} // namespace netbackup
