#ifndef CRUNCH_STORE_ERROR_HPP
#define CRUNCH_STORE_ERROR_HPP

#include <stdexcept>
#include <string>
#include "crypto/fingerprint.hpp"

namespace crunch {
namespace store {

class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

// Two different byte blocks produced the same fingerprint. Fatal to the build
class CollisionError : public StoreError {
public:
  CollisionError(const crypto::Fingerprint& fingerprint, const std::string& context)
    : StoreError("Fingerprint collision on " + crypto::to_hex(fingerprint) + " in file " + context)
    , fingerprint_(fingerprint)
    , context_(context) {}

  const crypto::Fingerprint& fingerprint() const { return fingerprint_; }
  const std::string& context() const { return context_; }

private:
  crypto::Fingerprint fingerprint_;
  std::string context_;
};

class DuplicatePathError : public StoreError {
public:
  explicit DuplicatePathError(const std::string& path)
    : StoreError("Path already registered: " + path), path_(path) {}

  const std::string& path() const { return path_; }

private:
  std::string path_;
};

// A registered file references a chunk that was never stored
class UnknownChunkError : public StoreError {
public:
  explicit UnknownChunkError(const crypto::Fingerprint& fingerprint)
    : StoreError("Unknown chunk: " + crypto::to_hex(fingerprint)), fingerprint_(fingerprint) {}

  const crypto::Fingerprint& fingerprint() const { return fingerprint_; }

private:
  crypto::Fingerprint fingerprint_;
};

class PathNotFoundError : public StoreError {
public:
  explicit PathNotFoundError(const std::string& path)
    : StoreError("Path not found: " + path), path_(path) {}

  const std::string& path() const { return path_; }

private:
  std::string path_;
};

} // namespace store
} // namespace crunch

#endif // CRUNCH_STORE_ERROR_HPP
