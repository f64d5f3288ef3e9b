#include "netbackup/network/request_handler.hpp"
#include "netbackup/crypto/integrity.hpp"
#include "netbackup/protocol/payload.hpp"
#include <boost/log/trivial.hpp>

namespace netbackup {
namespace network {

using protocol::MessageFrame;
using protocol::OpCode;
using protocol::StatusCode;

RequestHandler::RequestHandler(store::Store& store, const protocol::Digest& auth_token, std::size_t buffer_limit)
  : store_(store)
  , auth_token_(auth_token)
  , transfer_(store, buffer_limit) {
}


//==============================================
// DISPATCH
//==============================================

MessageFrame RequestHandler::handle(const MessageFrame& request) {
  StatusCode status = StatusCode::SUCCESS;
  std::vector<uint8_t> payload;

  try {
    crypto::verify(request, auth_token_);
    payload = dispatch(request);
  }
  catch (const crypto::IntegrityError& e) {
    status = StatusCode::INVALID_DATA;
    payload = protocol::to_bytes(e.what());
  }
  catch (const crypto::AuthError& e) {
    status = StatusCode::PERMISSION_DENIED;
    payload = protocol::to_bytes(e.what());
  }
  catch (const store::InvalidFilenameError& e) {
    status = StatusCode::INVALID_DATA;
    payload = protocol::to_bytes(e.what());
  }
  catch (const store::FileNotFoundError& e) {
    status = StatusCode::NOT_FOUND;
    payload = protocol::to_bytes(e.what());
  }
  catch (const store::StoreError& e) {
    BOOST_LOG_TRIVIAL(error) << "Request handler: Storage failure on request " << request.request_id << ": " << e.what();
    status = StatusCode::SERVER_ERROR;
    payload = protocol::to_bytes(e.what());
  }
  catch (const protocol::PayloadError& e) {
    status = StatusCode::INVALID_DATA;
    payload = protocol::to_bytes(e.what());
  }
  catch (const transfer::TransferError& e) {
    status = StatusCode::INVALID_DATA;
    payload = protocol::to_bytes(e.what());
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Request handler: Unexpected failure on request " << request.request_id << ": " << e.what();
    status = StatusCode::SERVER_ERROR;
    payload = protocol::to_bytes("Internal server error");
  }

  if (status == StatusCode::SUCCESS) {
    BOOST_LOG_TRIVIAL(info) << "Request handler: " << protocol::op_code_to_string(request.op_code)
                            << " #" << request.request_id << " -> " << protocol::status_to_string(status);
  } else {
    BOOST_LOG_TRIVIAL(warning) << "Request handler: " << protocol::op_code_to_string(request.op_code)
                               << " #" << request.request_id << " -> " << protocol::status_to_string(status)
                               << " (" << protocol::to_text(payload) << ")";
  }
  return make_response(request, status, std::move(payload));
}

std::vector<uint8_t> RequestHandler::dispatch(const MessageFrame& request) {
  switch (request.op_code) {
    case OpCode::AUTH:           return protocol::to_bytes("Authenticated");
    case OpCode::STORE:          return handle_store(request);
    case OpCode::RETRIEVE:       return handle_retrieve(request);
    case OpCode::DELETE:         return handle_delete(request);
    case OpCode::LIST:           return handle_list(request);
    case OpCode::STORE_CHUNK:    return handle_store_chunk(request);
    case OpCode::RETRIEVE_CHUNK: return handle_retrieve_chunk(request);
    case OpCode::STORE_COMPLETE: return handle_store_complete(request);
  }
  throw protocol::PayloadError("unknown operation code "
                               + std::to_string(static_cast<int>(request.op_code)));
}

MessageFrame RequestHandler::make_response(const MessageFrame& request, StatusCode status,
                                           std::vector<uint8_t> payload) {
  MessageFrame response;
  response.request_id = request.request_id;
  response.op_code = request.op_code;
  response.status = status;
  response.payload = std::move(payload);
  crypto::seal(response);
  return response;
}


//==============================================
// SINGLE-MESSAGE OPERATIONS
//==============================================

std::vector<uint8_t> RequestHandler::handle_store(const MessageFrame& request) {
  protocol::StorePayload store = protocol::decode_store(request.payload);
  store::FileMetadata metadata = store_.put(store.filename, store.data);
  return protocol::to_bytes("Stored " + std::to_string(metadata.size) + " bytes");
}

std::vector<uint8_t> RequestHandler::handle_retrieve(const MessageFrame& request) {
  std::string filename = protocol::decode_filename(request.payload);
  store::FileSlice slice = store_.read_range(filename, 0, protocol::MAX_RESPONSE_PAYLOAD_SIZE);
  if (slice.file_size > protocol::MAX_RESPONSE_PAYLOAD_SIZE) {
    throw protocol::PayloadError("file too large for a single-message retrieve, use chunked download");
  }
  return std::move(slice.data);
}

std::vector<uint8_t> RequestHandler::handle_delete(const MessageFrame& request) {
  std::string filename = protocol::decode_filename(request.payload);
  store_.remove(filename);
  return protocol::to_bytes("Deleted");
}

std::vector<uint8_t> RequestHandler::handle_list(const MessageFrame& /*request*/) {
  std::vector<uint8_t> listing = protocol::encode_listing(store_.list());
  if (listing.size() > protocol::MAX_RESPONSE_PAYLOAD_SIZE) {
    throw store::StoreError("Listing exceeds the maximum response size");
  }
  return listing;
}


//==============================================
// CHUNKED OPERATIONS
//==============================================

std::vector<uint8_t> RequestHandler::handle_store_chunk(const MessageFrame& request) {
  protocol::ChunkPayload chunk = protocol::decode_chunk(request.payload);
  bool complete = transfer_.store_chunk(chunk);
  return protocol::to_bytes(complete ? "COMPLETE" : "OK");
}

std::vector<uint8_t> RequestHandler::handle_retrieve_chunk(const MessageFrame& request) {
  protocol::ChunkPayload query = protocol::decode_chunk(request.payload, false);
  protocol::ChunkPayload chunk = transfer_.retrieve_chunk(query.filename, query.chunk_index);
  return protocol::encode_chunk(chunk);
}

std::vector<uint8_t> RequestHandler::handle_store_complete(const MessageFrame& request) {
  std::string filename = protocol::decode_filename(request.payload);
  store::FileMetadata metadata = transfer_.complete(filename);
  return protocol::to_bytes("Stored " + std::to_string(metadata.size) + " bytes, sha256 "
                            + crypto::to_hex(metadata.checksum));
}

} // namespace network
} // namespace netbackup
