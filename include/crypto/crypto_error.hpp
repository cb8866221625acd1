#ifndef CRUNCH_CRYPTO_ERROR_HPP
#define CRUNCH_CRYPTO_ERROR_HPP

#include <stdexcept>
#include <string>

namespace crunch::crypto {

class CryptoError : public std::runtime_error {
public:
    explicit CryptoError(const std::string& message) 
        : std::runtime_error(message) {}
};

class FingerprintError : public CryptoError {
public:
    explicit FingerprintError(const std::string& message) 
        : CryptoError("Fingerprint error: " + message) {}
};

} // namespace crunch::crypto

#endif // CRUNCH_CRYPTO_ERROR_HPP
