#ifndef NETBACKUP_NETWORK_REQUEST_HANDLER_HPP
#define NETBACKUP_NETWORK_REQUEST_HANDLER_HPP

#include <cstddef>
#include <vector>
#include "netbackup/protocol/message_frame.hpp"
#include "netbackup/store/store.hpp"
#include "netbackup/transfer/transfer_engine.hpp"

namespace netbackup {
namespace network {

// Turns one decoded request into one sealed response. Owns the session's
// in-progress uploads through its TransferEngine.
class RequestHandler {
public:
  RequestHandler(store::Store& store, const protocol::Digest& auth_token,
                 std::size_t buffer_limit = transfer::DEFAULT_SESSION_BUFFER_LIMIT);

  RequestHandler(const RequestHandler&) = delete;
  RequestHandler& operator=(const RequestHandler&) = delete;


  // ---- DISPATCH ----
  // Never throws for recoverable failures: they become an error status with
  // the reason as payload. The response echoes request_id and op_code.
  protocol::MessageFrame handle(const protocol::MessageFrame& request);


  // ---- GETTERS ----
  transfer::TransferEngine& transfer_engine() { return transfer_; }

private:
  store::Store& store_;
  const protocol::Digest auth_token_;
  transfer::TransferEngine transfer_;


  // ---- OPERATIONS ----
  // Each returns the success payload and throws on failure
  std::vector<uint8_t> handle_store(const protocol::MessageFrame& request);
  std::vector<uint8_t> handle_retrieve(const protocol::MessageFrame& request);
  std::vector<uint8_t> handle_delete(const protocol::MessageFrame& request);
  std::vector<uint8_t> handle_list(const protocol::MessageFrame& request);
  std::vector<uint8_t> handle_store_chunk(const protocol::MessageFrame& request);
  std::vector<uint8_t> handle_retrieve_chunk(const protocol::MessageFrame& request);
  std::vector<uint8_t> handle_store_complete(const protocol::MessageFrame& request);

  std::vector<uint8_t> dispatch(const protocol::MessageFrame& request);
  static protocol::MessageFrame make_response(const protocol::MessageFrame& request,
                                              protocol::StatusCode status,
                                              std::vector<uint8_t> payload);
};

} // namespace network
} // namespace netbackup

#endif // NETBACKUP_NETWORK_REQUEST_HANDLER_HPP
