#include "netbackup/network/session.hpp"
#include <boost/log/trivial.hpp>
#include <array>

namespace netbackup {
namespace network {

namespace {
constexpr std::size_t READ_BUFFER_SIZE = 8192;
}

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Session::Session(uint64_t session_id, boost::asio::ip::tcp::socket socket,
                 store::Store& store, const protocol::Digest& auth_token)
  : session_id_(session_id)
  , socket_(std::move(socket))
  , codec_(protocol::MAX_FRAME_LENGTH)
  , handler_(store, auth_token) {
  boost::system::error_code ec;
  auto endpoint = socket_.remote_endpoint(ec);
  remote_endpoint_ = ec ? "unknown" : endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
  BOOST_LOG_TRIVIAL(debug) << "Session: Session " << session_id_ << " created for " << remote_endpoint_;
}

Session::~Session() {
  stop();
  BOOST_LOG_TRIVIAL(debug) << "Session: Session " << session_id_ << " destroyed";
}


//==============================================
// LIFECYCLE
//==============================================

bool Session::start() {
  if (!socket_.is_open()) {
    BOOST_LOG_TRIVIAL(error) << "Session: Cannot start session " << session_id_ << " - socket not connected";
    return false;
  }
  if (processing_thread_) {
    BOOST_LOG_TRIVIAL(debug) << "Session: Session " << session_id_ << " already started";
    return true;
  }

  active_ = true;
  processing_thread_ = std::make_unique<std::thread>(&Session::process_stream, this);
  BOOST_LOG_TRIVIAL(info) << "Session: Session " << session_id_ << " started for " << remote_endpoint_;
  return true;
}

void Session::stop() {
  stopping_ = true;

  if (active_) {
    // Wakes the blocking read in the processing thread
    shutdown_socket();
  }

  if (processing_thread_ && processing_thread_->joinable()) {
    processing_thread_->join();
    processing_thread_.reset();
    BOOST_LOG_TRIVIAL(debug) << "Session: Processing thread joined for session " << session_id_;
  }
}


//==============================================
// PROCESSING
//==============================================

void Session::process_stream() {
  std::array<uint8_t, READ_BUFFER_SIZE> buffer;

  try {
    while (!stopping_) {
      boost::system::error_code ec;
      std::size_t bytes_read = socket_.read_some(boost::asio::buffer(buffer), ec);

      if (ec == boost::asio::error::eof) {
        BOOST_LOG_TRIVIAL(info) << "Session: Client " << remote_endpoint_ << " disconnected";
        break;
      }
      if (ec) {
        if (!stopping_) {
          BOOST_LOG_TRIVIAL(error) << "Session: Read error from " << remote_endpoint_ << ": " << ec.message();
        }
        break;
      }

      codec_.feed(buffer.data(), bytes_read);

      protocol::MessageFrame request;
      bool connection_ok = true;
      while (connection_ok && codec_.decode(request) == protocol::Codec::DecodeStatus::FRAME_READY) {
        protocol::MessageFrame response = handler_.handle(request);
        connection_ok = send_frame(response);
      }
      if (!connection_ok) {
        break;
      }
    }
  }
  catch (const protocol::MalformedFrameError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Session: Dropping " << remote_endpoint_ << ": " << e.what();
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Session: Processing error for " << remote_endpoint_ << ": " << e.what();
  }

  cleanup_connection();
  BOOST_LOG_TRIVIAL(info) << "Session: Session " << session_id_ << " ended";
}

bool Session::send_frame(const protocol::MessageFrame& frame) {
  try {
    std::vector<uint8_t> bytes = protocol::Codec::encode(frame);

    boost::system::error_code ec;
    std::size_t bytes_written = boost::asio::write(socket_, boost::asio::buffer(bytes), ec);
    if (ec || bytes_written != bytes.size()) {
      BOOST_LOG_TRIVIAL(error) << "Session: Send error to " << remote_endpoint_ << ": " << ec.message();
      return false;
    }

    BOOST_LOG_TRIVIAL(trace) << "Session: Sent " << bytes_written << " bytes to " << remote_endpoint_;
    return true;
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Session: Failed to encode response: " << e.what();
    return false;
  }
}


//==============================================
// TEARDOWN
//==============================================

void Session::cleanup_connection() {
  // Uploads that never reached StoreComplete are dropped with the connection
  handler_.transfer_engine().abandon_all();
  codec_.reset();

  shutdown_socket();
  active_ = false;
}

bool Session::shutdown_socket() {
  // stop() and the processing thread race here, only the first caller touches the socket
  if (shutdown_issued_.exchange(true)) {
    return false;
  }

  boost::system::error_code ec;
  socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
  if (ec && ec != boost::asio::error::not_connected) {
    BOOST_LOG_TRIVIAL(debug) << "Session: Socket shutdown error: " << ec.message();
  }
  return true;
}

} // namespace network
} // namespace netbackup
