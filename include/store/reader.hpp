#ifndef CRUNCH_READER_HPP
#define CRUNCH_READER_HPP

#include <cstdint>
#include <set>
#include <string>
#include <string_view>
#include <vector>
#include "store/chunk_store.hpp"
#include "store/file_registry.hpp"

namespace crunch {
namespace store {

// Read-only view over a finished build. Paths resolve with or without a
// single leading '/'. Unknown paths throw PathNotFoundError.
class Reader {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Reader(const ChunkStore& chunk_store, const FileRegistry& registry);


  // ---- QUERY OPERATIONS ----
  uint64_t size(const std::string& path) const;
  bool mem(const std::string& path) const;
  std::set<std::string> list() const;


  // ---- READ OPERATIONS ----
  // Fragments covering [offset, offset + length), clamped to the file size
  std::vector<std::string_view> read(const std::string& path, uint64_t offset, uint64_t length) const;
  // Whole file contents
  std::string read_all(const std::string& path) const;

private:
  // ---- PARAMETERS ----
  const ChunkStore& chunk_store_;
  const FileRegistry& registry_;

  // Finds the entry for path or its '/'-stripped alias
  FileEntry resolve(const std::string& path) const;
};

} // namespace store
} // namespace crunch

#endif // CRUNCH_READER_HPP
