#ifndef CRUNCH_FINGERPRINT_HPP
#define CRUNCH_FINGERPRINT_HPP

#include <array>
#include <cstdint>
#include <cstring>
#include <functional>
#include <string>
#include <string_view>
#include "crypto_error.hpp"

namespace crunch::crypto {

// Width of an MD5 digest
static constexpr size_t FINGERPRINT_SIZE = 16;

using Fingerprint = std::array<uint8_t, FINGERPRINT_SIZE>;

// Maps a byte block to its fingerprint. Swappable so tests can force collisions
using FingerprintFunction = std::function<Fingerprint(std::string_view)>;

// Computes the MD5 digest of a byte block through OpenSSL EVP.
// Used as a content fingerprint only, never as a security primitive.
Fingerprint fingerprint(std::string_view bytes);

// Renders a fingerprint as 32 lowercase hex characters
std::string to_hex(const Fingerprint& fp);

// Hash functor so fingerprints can key unordered containers
struct FingerprintHash {
    size_t operator()(const Fingerprint& fp) const noexcept {
        // The digest is already uniformly distributed, so its leading bytes suffice
        size_t value = 0;
        std::memcpy(&value, fp.data(), sizeof(value));
        return value;
    }
};

} // namespace crunch::crypto

#endif // CRUNCH_FINGERPRINT_HPP
