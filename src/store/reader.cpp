#include "store/reader.hpp"
#include "range/range_reader.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>

namespace crunch {
namespace store {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Reader::Reader(const ChunkStore& chunk_store, const FileRegistry& registry)
  : chunk_store_(chunk_store)
  , registry_(registry) {}


//==============================================
// QUERY OPERATIONS
//==============================================

uint64_t Reader::size(const std::string& path) const {
  return resolve(path).size;
}

bool Reader::mem(const std::string& path) const {
  if (registry_.contains(path)) {
    return true;
  }
  return !path.empty() && path.front() == '/' && registry_.contains(path.substr(1));
}

std::set<std::string> Reader::list() const {
  return registry_.list_paths();
}


//==============================================
// READ OPERATIONS
//==============================================

std::vector<std::string_view> Reader::read(const std::string& path, uint64_t offset,
                                           uint64_t length) const {
  BOOST_LOG_TRIVIAL(debug) << "Reader: Reading " << path << " offset " << offset << " length " << length;

  FileEntry entry = resolve(path);

  // Clamp the window to the data actually held
  if (offset >= entry.size || length == 0 || entry.chunks.empty()) {
    return {};
  }
  if (length > entry.size - offset) {
    length = entry.size - offset;
  }

  // Every chunk but the last is one sector long, so the window's chunks are
  // found by division and nothing before or after them is resolved
  const uint64_t sector = chunk_store_.get(entry.chunks.front()).size();
  if (sector == 0) {
    return range::read_range(range::resolve_chunks(chunk_store_, entry), offset, length);
  }
  const size_t first =
    static_cast<size_t>(std::min<uint64_t>(offset / sector, entry.chunks.size() - 1));
  const size_t last = static_cast<size_t>((offset + length - 1) / sector + 1);

  return range::read_range(range::resolve_chunks(chunk_store_, entry, first, last),
                           offset - first * sector, length);
}

std::string Reader::read_all(const std::string& path) const {
  FileEntry entry = resolve(path);

  std::string contents;
  contents.reserve(entry.size);
  for (const auto& fp : entry.chunks) {
    contents += chunk_store_.get(fp);
  }
  BOOST_LOG_TRIVIAL(debug) << "Reader: Read " << contents.size() << " bytes from " << path;
  return contents;
}


//==============================================
// UTILITY METHODS
//==============================================

FileEntry Reader::resolve(const std::string& path) const {
  if (auto entry = registry_.lookup(path)) {
    return *entry;
  }
  if (!path.empty() && path.front() == '/') {
    if (auto entry = registry_.lookup(path.substr(1))) {
      return *entry;
    }
  }
  BOOST_LOG_TRIVIAL(debug) << "Reader: Path not found: " << path;
  throw PathNotFoundError(path);
}

} // namespace store
} // namespace crunch
