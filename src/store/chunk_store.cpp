#include "store/chunk_store.hpp"
#include <utility>
#include <vector>
#include <boost/log/trivial.hpp>

namespace crunch {
namespace store {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ChunkStore::ChunkStore() : ChunkStore(&crypto::fingerprint) {}

ChunkStore::ChunkStore(crypto::FingerprintFunction fingerprint_fn)
  : fingerprint_fn_(std::move(fingerprint_fn)) {
  if (!fingerprint_fn_) {
    throw std::invalid_argument("ChunkStore: Fingerprint function must not be empty");
  }
  BOOST_LOG_TRIVIAL(debug) << "ChunkStore: Initialized empty chunk store";
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

crypto::Fingerprint ChunkStore::put(std::string_view bytes, const std::string& context) {
  // Hash outside the lock, the fingerprint function is pure
  crypto::Fingerprint fp = fingerprint_fn_(bytes);

  std::lock_guard<std::mutex> lock(mutex_);
  ++stats_.puts;

  auto it = chunks_.find(fp);
  if (it == chunks_.end()) {
    chunks_.emplace(fp, Chunk(bytes));
    ++stats_.chunks;
    stats_.stored_bytes += bytes.size();
    BOOST_LOG_TRIVIAL(debug) << "ChunkStore: Stored new chunk " << crypto::to_hex(fp)
                             << " (" << bytes.size() << " bytes) from " << context;
    return fp;
  }

  if (it->second != bytes) {
    BOOST_LOG_TRIVIAL(fatal) << "ChunkStore: Fingerprint collision on " << crypto::to_hex(fp)
                             << " while processing " << context;
    throw CollisionError(fp, context);
  }

  ++stats_.dedup_hits;
  BOOST_LOG_TRIVIAL(debug) << "ChunkStore: Dedup hit on " << crypto::to_hex(fp) << " from " << context;
  return fp;
}

const Chunk& ChunkStore::get(const crypto::Fingerprint& fingerprint) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = chunks_.find(fingerprint);
  if (it == chunks_.end()) {
    BOOST_LOG_TRIVIAL(fatal) << "ChunkStore: Dangling fingerprint " << crypto::to_hex(fingerprint);
    throw UnknownChunkError(fingerprint);
  }
  // Node-based map, the reference stays valid across later inserts
  return it->second;
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool ChunkStore::has(const crypto::Fingerprint& fingerprint) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return chunks_.count(fingerprint) != 0;
}

size_t ChunkStore::chunk_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return chunks_.size();
}

uint64_t ChunkStore::stored_bytes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_.stored_bytes;
}

ChunkStoreStats ChunkStore::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

void ChunkStore::for_each_chunk(
    const std::function<void(const crypto::Fingerprint&, const Chunk&)>& visitor) const {
  // Snapshot under the lock so the visitor may query this store
  std::vector<std::pair<const crypto::Fingerprint*, const Chunk*>> snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshot.reserve(chunks_.size());
    for (const auto& [fp, chunk] : chunks_) {
      snapshot.emplace_back(&fp, &chunk);
    }
  }
  for (const auto& [fp, chunk] : snapshot) {
    visitor(*fp, *chunk);
  }
}

} // namespace store
} // namespace crunch
