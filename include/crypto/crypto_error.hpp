#ifndef RPIPE_CRYPTO_ERROR_HPP
#define RPIPE_CRYPTO_ERROR_HPP

#include <string>
#include "common/pipe_error.hpp"

namespace rpipe::crypto {

// OpenSSL failure or invalid key material
class CryptoError : public PipeError {
public:
    explicit CryptoError(const std::string& message) 
        : PipeError("Crypto error: " + message) {}
};

class KeyDerivationError : public CryptoError {
public:
    explicit KeyDerivationError(const std::string& message) 
        : CryptoError("Key derivation error: " + message) {}
};

// Tag mismatch: the chunk is corrupt or was tampered with
class AuthError : public IntegrityError {
public:
    explicit AuthError(const std::string& message) 
        : IntegrityError("Authentication failed: " + message) {}
};

} // namespace rpipe::crypto

#endif // RPIPE_CRYPTO_ERROR_HPP
