#include "netbackup/network/tcp_server.hpp"
#include <boost/log/trivial.hpp>
#include <vector>

namespace netbackup {
namespace network {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

TCP_Server::TCP_Server(const std::string& address, uint16_t port, store::Store& store,
                       const protocol::Digest& auth_token)
  : port_(port)
  , address_(address)
  , store_(store)
  , auth_token_(auth_token) {
  BOOST_LOG_TRIVIAL(info) << "TCP server: Initializing TCP server on " << address << ":" << port;
}

TCP_Server::~TCP_Server() {
  shutdown();
}


//==============================================
// INITIALIZATION AND TEARDOWN
//==============================================

bool TCP_Server::start_listener() {
  if (is_running_) {
    BOOST_LOG_TRIVIAL(warning) << "TCP server: Server already running";
    return false;
  }

  try {
    // Create endpoint
    boost::asio::ip::tcp::endpoint endpoint(
      boost::asio::ip::make_address(address_),
      port_
    );

    // Create acceptor
    acceptor_ = std::make_unique<boost::asio::ip::tcp::acceptor>(
      io_context_,
      endpoint
    );
    port_ = acceptor_->local_endpoint().port();
    BOOST_LOG_TRIVIAL(debug) << "TCP server: Acceptor bound to port " << port_;

    is_running_ = true;

    // Start accepting connections
    start_accept();

    // Start io_context in a separate thread
    io_context_.restart();
    io_thread_ = std::make_unique<std::thread>([this]() {
      try {
        auto work_guard = boost::asio::make_work_guard(io_context_);
        io_context_.run();
      } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "TCP server: IO context error: " << e.what();
        is_running_ = false;
      }
    });

    BOOST_LOG_TRIVIAL(info) << "TCP server: Server listening on " << address_ << ":" << port_;
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "TCP server: Failed to start server: " << e.what();
    acceptor_.reset();
    return false;
  }
}

void TCP_Server::start_accept() {
  if (!acceptor_ || !is_running_) {
    return;
  }

  // Set up async accept operation
  acceptor_->async_accept(
    [this](const boost::system::error_code& error, boost::asio::ip::tcp::socket socket) {
      if (!error) {
        create_session(std::move(socket));
      } else if (error != boost::asio::error::operation_aborted) {
        BOOST_LOG_TRIVIAL(error) << "TCP server: Accept error: " << error.message();
      }
      if (is_running_) {
        start_accept();  // Continue accepting new connections
      }
    });
}

void TCP_Server::create_session(boost::asio::ip::tcp::socket socket) {
  reap_finished_sessions();

  std::lock_guard<std::mutex> lock(sessions_mutex_);
  if (!is_running_) {
    return;
  }

  uint64_t session_id = next_session_id_++;
  auto session = std::make_unique<Session>(session_id, std::move(socket), store_, auth_token_);
  if (!session->start()) {
    BOOST_LOG_TRIVIAL(error) << "TCP server: Could not start session " << session_id;
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "TCP server: Accepted connection from " << session->get_remote_endpoint()
                          << " as session " << session_id;
  sessions_.emplace(session_id, std::move(session));
}

void TCP_Server::reap_finished_sessions() {
  std::vector<std::unique_ptr<Session>> finished;
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    for (auto it = sessions_.begin(); it != sessions_.end();) {
      if (!it->second->is_active()) {
        finished.push_back(std::move(it->second));
        it = sessions_.erase(it);
      } else {
        ++it;
      }
    }
  }
  // Destroying a session joins its thread, done outside the lock
  finished.clear();
}

void TCP_Server::shutdown() {
  if (!is_running_ && !io_thread_) {
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "TCP server: Initiating server shutdown";

  is_running_ = false;

  // Stop io_context
  io_context_.stop();

  // Wait for io_thread to finish
  if (io_thread_ && io_thread_->joinable()) {
    io_thread_->join();
  }
  io_thread_.reset();

  // Stop accepting new connections, safe now that no handler can run
  if (acceptor_ && acceptor_->is_open()) {
    boost::system::error_code ec;
    acceptor_->close(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "TCP server: Error closing acceptor: " << ec.message();
    }
  }

  // Close every connection and wait for its thread
  std::map<uint64_t, std::unique_ptr<Session>> sessions;
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions.swap(sessions_);
  }
  for (auto& [id, session] : sessions) {
    session->stop();
  }
  sessions.clear();

  BOOST_LOG_TRIVIAL(info) << "TCP server: Server shutdown complete";
}


//==============================================
// GETTERS
//==============================================

std::size_t TCP_Server::active_sessions() const {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  std::size_t count = 0;
  for (const auto& [id, session] : sessions_) {
    if (session->is_active()) {
      ++count;
    }
  }
  return count;
}

} // namespace network
} // namespace netbackup
