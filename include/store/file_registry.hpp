#ifndef CRUNCH_FILE_REGISTRY_HPP
#define CRUNCH_FILE_REGISTRY_HPP

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>
#include "crypto/fingerprint.hpp"
#include "store/store_error.hpp"

namespace crunch {
namespace store {

struct FileEntry {
  std::string path;
  std::vector<crypto::Fingerprint> chunks;  // in file order
  uint64_t size = 0;
};

// path -> FileEntry, one entry per file, paths unique
class FileRegistry {
public:

  // ---- REGISTRATION ----
  // Claims path for a file still being chunked. Throws DuplicatePathError if
  // the path is registered or already claimed.
  void reserve_path(const std::string& path);
  // Drops a claim whose file was never registered
  void release_path(const std::string& path);
  // Registers entry, fulfilling a claim on its path if there is one.
  // Throws DuplicatePathError if the path is already registered.
  void register_file(FileEntry entry);


  // ---- QUERY OPERATIONS ----
  std::optional<FileEntry> lookup(const std::string& path) const;
  std::optional<uint64_t> size_of(const std::string& path) const;
  bool contains(const std::string& path) const;
  std::set<std::string> list_paths() const;
  size_t file_count() const;
  // Visits a snapshot of the entries in registration order. The visitor may
  // call back into this registry.
  void for_each_file(const std::function<void(const FileEntry&)>& visitor) const;

private:
  // ---- PARAMETERS ----
  std::vector<FileEntry> entries_;
  std::unordered_map<std::string, size_t> index_;  // path -> position in entries_
  std::set<std::string> reserved_;                 // claimed, not yet registered
  mutable std::mutex mutex_;
};

} // namespace store
} // namespace crunch

#endif // CRUNCH_FILE_REGISTRY_HPP
