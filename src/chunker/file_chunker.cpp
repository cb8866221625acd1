#include "chunker/file_chunker.hpp"
#include <sstream>
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace crunch {
namespace chunker {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

FileChunker::FileChunker(store::ChunkStore& chunk_store, store::FileRegistry& registry,
                         ChunkerOptions options)
  : chunk_store_(chunk_store)
  , registry_(registry)
  , options_(options) {
  if (options_.sector_size == 0) {
    BOOST_LOG_TRIVIAL(error) << "FileChunker: Sector size must be positive";
    throw std::invalid_argument("FileChunker: Sector size must be positive");
  }
  BOOST_LOG_TRIVIAL(debug) << "FileChunker: Initialized with sector size " << options_.sector_size;
}


//==============================================
// CHUNKING
//==============================================

store::FileEntry FileChunker::chunk_file(const std::string& path, std::string_view bytes) {
  BOOST_LOG_TRIVIAL(debug) << "FileChunker: Chunking " << path << " (" << bytes.size() << " bytes)";

  // Claim the path before touching the store, a second writer for it fails here
  registry_.reserve_path(path);

  store::FileEntry entry;
  entry.path = path;
  entry.size = bytes.size();

  const size_t sector = options_.sector_size;
  const size_t size = bytes.size();
  entry.chunks.reserve((size + sector - 1) / sector);

  try {
    size_t idx = 0;
    while (idx < size) {
      // Final window is short when fewer than a sector of bytes remain
      size_t window = (size - idx >= sector) ? sector : size - idx;
      entry.chunks.push_back(chunk_store_.put(bytes.substr(idx, window), path));
      idx += window;
    }
    registry_.register_file(entry);
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "FileChunker: Failed to chunk " << path << ": " << e.what();
    registry_.release_path(path);
    throw;
  }

  BOOST_LOG_TRIVIAL(info) << "FileChunker: Chunked " << path << " into " << entry.chunks.size()
                          << " chunks (" << entry.size << " bytes)";
  return entry;
}

store::FileEntry FileChunker::chunk_stream(const std::string& path, std::istream& input) {
  if (!input.good()) {
    BOOST_LOG_TRIVIAL(error) << "FileChunker: Invalid input stream for " << path;
    throw std::runtime_error("FileChunker: Invalid input stream for " + path);
  }

  std::ostringstream buffer;
  buffer << input.rdbuf();
  if (input.bad()) {
    throw std::runtime_error("FileChunker: Failed reading input stream for " + path);
  }
  return chunk_file(path, buffer.str());
}

} // namespace chunker
} // namespace crunch
