#include "netbackup/crypto/integrity.hpp"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <boost/log/trivial.hpp>
#include <iomanip>
#include <sstream>

namespace netbackup::crypto {

//=================================================
// RAII WRAPPER TO MANAGE DIGEST CONTEXT LIFECYCLE
//=================================================

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw DigestError("Failed to create digest context");
    }
  }

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  EVP_MD_CTX* get() { return ctx; }
};


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Sha256::Sha256() : context_(std::make_unique<DigestContext>()) {
  if (!EVP_DigestInit_ex(context_->get(), EVP_sha256(), nullptr)) {
    throw DigestError("Failed to initialize SHA-256");
  }
}

Sha256::~Sha256() = default;


//==============================================
// HASHING OPERATIONS
//==============================================

void Sha256::update(const void* data, std::size_t size) {
  if (finalized_) {
    throw DigestError("Update after finalize");
  }
  if (size == 0) {
    return;
  }
  if (!EVP_DigestUpdate(context_->get(), data, size)) {
    throw DigestError("Failed to update SHA-256");
  }
}

void Sha256::update(std::istream& input) {
  char buffer[8192];
  while (input.read(buffer, sizeof(buffer))) {
    update(buffer, static_cast<std::size_t>(input.gcount()));
  }
  // Final partial block
  if (input.gcount() > 0) {
    update(buffer, static_cast<std::size_t>(input.gcount()));
  }
  if (input.bad()) {
    throw DigestError("Failed to read input stream");
  }
}

Digest Sha256::finalize() {
  if (finalized_) {
    throw DigestError("Digest already finalized");
  }

  Digest digest{};
  unsigned int digest_len = 0;
  if (!EVP_DigestFinal_ex(context_->get(), digest.data(), &digest_len) || digest_len != digest.size()) {
    throw DigestError("Failed to finalize SHA-256");
  }
  finalized_ = true;
  return digest;
}


//==============================================
// TOKEN AND CHECKSUM DERIVATION
//==============================================

Digest derive_token(const std::string& secret) {
  return checksum(secret.data(), secret.size());
}

Digest checksum(const std::vector<uint8_t>& payload) {
  return checksum(payload.data(), payload.size());
}

Digest checksum(const void* data, std::size_t size) {
  Sha256 hasher;
  hasher.update(data, size);
  return hasher.finalize();
}


//==============================================
// VERIFICATION
//==============================================

bool digests_equal(const Digest& lhs, const Digest& rhs) {
  return CRYPTO_memcmp(lhs.data(), rhs.data(), lhs.size()) == 0;
}

void verify_integrity(const protocol::MessageFrame& frame) {
  if (!digests_equal(checksum(frame.payload), frame.checksum)) {
    BOOST_LOG_TRIVIAL(warning) << "Integrity: Checksum mismatch on request " << frame.request_id;
    throw IntegrityError("checksum does not match payload");
  }
}

void verify(const protocol::MessageFrame& frame, const Digest& expected_token) {
  verify_integrity(frame);

  if (!digests_equal(frame.auth_token, expected_token)) {
    BOOST_LOG_TRIVIAL(warning) << "Integrity: Invalid auth token on request " << frame.request_id;
    throw AuthError("invalid authentication token");
  }
}

void seal(protocol::MessageFrame& frame) {
  frame.checksum = checksum(frame.payload);
}


//==============================================
// FORMATTING
//==============================================

std::string to_hex(const Digest& digest) {
  std::stringstream ss;
  for (uint8_t byte : digest) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  }
  return ss.str();
}

} // namespace netbackup::crypto
