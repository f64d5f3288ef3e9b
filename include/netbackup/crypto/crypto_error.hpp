#ifndef NETBACKUP_CRYPTO_ERROR_HPP
#define NETBACKUP_CRYPTO_ERROR_HPP

#include <stdexcept>
#include <string>

namespace netbackup::crypto {

class CryptoError : public std::runtime_error {
public:
    explicit CryptoError(const std::string& message)
        : std::runtime_error(message) {}
};

// OpenSSL digest context could not be created or driven
class DigestError : public CryptoError {
public:
    explicit DigestError(const std::string& message)
        : CryptoError("Digest error: " + message) {}
};

// Payload does not hash to the checksum carried in the frame
class IntegrityError : public CryptoError {
public:
    explicit IntegrityError(const std::string& message)
        : CryptoError("Integrity error: " + message) {}
};

// Frame token does not match the configured shared secret
class AuthError : public CryptoError {
public:
    explicit AuthError(const std::string& message)
        : CryptoError("Authentication error: " + message) {}
};

} // namespace netbackup::crypto

#endif // NETBACKUP_CRYPTO_ERROR_HPP
