#ifndef CRUNCH_FILE_CHUNKER_HPP
#define CRUNCH_FILE_CHUNKER_HPP

#include <cstddef>
#include <istream>
#include <string>
#include <string_view>
#include "store/chunk_store.hpp"
#include "store/file_registry.hpp"

namespace crunch {
namespace chunker {

// Default window, simulates reading whole disk sectors
static constexpr size_t SECTOR_SIZE = 4096;

struct ChunkerOptions {
  size_t sector_size = SECTOR_SIZE;
};

class FileChunker {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  FileChunker(store::ChunkStore& chunk_store, store::FileRegistry& registry,
              ChunkerOptions options = {});


  // ---- CHUNKING ----
  // Splits bytes into sector sized windows (the last one may be short), stores
  // each window and registers the resulting entry under path.
  // Throws DuplicatePathError if path was already chunked or is being chunked
  // by another thread. Nothing is stored in that case.
  store::FileEntry chunk_file(const std::string& path, std::string_view bytes);
  // Reads input to the end and chunks it as one file
  store::FileEntry chunk_stream(const std::string& path, std::istream& input);


  // ---- GETTERS ----
  size_t sector_size() const { return options_.sector_size; }

private:
  // ---- PARAMETERS ----
  store::ChunkStore& chunk_store_;
  store::FileRegistry& registry_;
  ChunkerOptions options_;
};

} // namespace chunker
} // namespace crunch

#endif // CRUNCH_FILE_CHUNKER_HPP
