#ifndef CRUNCH_CHUNK_STORE_HPP
#define CRUNCH_CHUNK_STORE_HPP

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include "crypto/fingerprint.hpp"
#include "store/store_error.hpp"

namespace crunch {
namespace store {

// Bytes of one stored chunk
using Chunk = std::string;

struct ChunkStoreStats {
  uint64_t puts = 0;          // every put call, hits included
  uint64_t dedup_hits = 0;    // puts answered by an existing chunk
  uint64_t chunks = 0;        // distinct fingerprints held
  uint64_t stored_bytes = 0;  // sum of distinct chunk lengths
};

// Append-only mapping fingerprint -> chunk bytes with collision detection.
// Instances are independent: every build owns its own store.
class ChunkStore {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  ChunkStore();
  // Uses the given fingerprint function in place of MD5
  explicit ChunkStore(crypto::FingerprintFunction fingerprint_fn);

  ChunkStore(const ChunkStore&) = delete;
  ChunkStore& operator=(const ChunkStore&) = delete;


  // ---- CORE STORAGE OPERATIONS ----
  // Stores a block and returns its fingerprint. An identical block already
  // present is a dedup hit and leaves the store untouched. A different block
  // under the same fingerprint throws CollisionError naming context.
  crypto::Fingerprint put(std::string_view bytes, const std::string& context);
  // Returns the stored bytes, throws UnknownChunkError if absent
  const Chunk& get(const crypto::Fingerprint& fingerprint) const;


  // ---- QUERY OPERATIONS ----
  bool has(const crypto::Fingerprint& fingerprint) const;
  size_t chunk_count() const;
  uint64_t stored_bytes() const;
  ChunkStoreStats stats() const;
  // Visits every stored chunk, in no particular order. The visitor runs
  // without the lock held and may call back into this store.
  void for_each_chunk(const std::function<void(const crypto::Fingerprint&, const Chunk&)>& visitor) const;

private:
  // ---- PARAMETERS ----
  crypto::FingerprintFunction fingerprint_fn_;
  std::unordered_map<crypto::Fingerprint, Chunk, crypto::FingerprintHash> chunks_;
  ChunkStoreStats stats_;
  // Guards the check-then-insert in put
  mutable std::mutex mutex_;
};

} // namespace store
} // namespace crunch

#endif // CRUNCH_CHUNK_STORE_HPP
