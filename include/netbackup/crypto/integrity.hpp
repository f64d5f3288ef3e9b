#ifndef NETBACKUP_CRYPTO_INTEGRITY_HPP
#define NETBACKUP_CRYPTO_INTEGRITY_HPP

#include <cstdint>
#include <istream>
#include <memory>
#include <string>
#include <vector>
#include "netbackup/crypto/crypto_error.hpp"
#include "netbackup/protocol/message_frame.hpp"

namespace netbackup::crypto {

using protocol::Digest;

// Forward declaration for OpenSSL digest context
struct DigestContext;

// Incremental SHA-256 over OpenSSL EVP
class Sha256 {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Sha256();
  ~Sha256();

  Sha256(const Sha256&) = delete;
  Sha256& operator=(const Sha256&) = delete;


  // ---- HASHING OPERATIONS ----
  void update(const void* data, std::size_t size);
  // Consumes the stream until EOF
  void update(std::istream& input);
  // Returns the digest, the hasher cannot be updated afterwards
  Digest finalize();

private:
  std::unique_ptr<DigestContext> context_;
  bool finalized_ = false;
};


// ---- TOKEN AND CHECKSUM DERIVATION ----
// SHA-256 of the shared secret bytes
Digest derive_token(const std::string& secret);
// SHA-256 of a payload
Digest checksum(const std::vector<uint8_t>& payload);
Digest checksum(const void* data, std::size_t size);


// ---- VERIFICATION ----
// Compares two digests without early exit
bool digests_equal(const Digest& lhs, const Digest& rhs);
// Throws IntegrityError if the checksum does not cover the payload,
// then AuthError if the token differs from expected_token
void verify(const protocol::MessageFrame& frame, const Digest& expected_token);
// Integrity check only, used by clients on responses
void verify_integrity(const protocol::MessageFrame& frame);
// Sets the frame checksum from its current payload
void seal(protocol::MessageFrame& frame);


// ---- FORMATTING ----
std::string to_hex(const Digest& digest);

} // namespace netbackup::crypto

#endif // NETBACKUP_CRYPTO_INTEGRITY_HPP
