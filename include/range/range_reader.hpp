#ifndef CRUNCH_RANGE_READER_HPP
#define CRUNCH_RANGE_READER_HPP

#include <cstdint>
#include <string_view>
#include <vector>
#include "store/chunk_store.hpp"
#include "store/file_registry.hpp"

namespace crunch {
namespace range {

// How one chunk relates to the part of the window still to be served
enum class Overlap {
  Satisfied,        // window already served in full
  Before,           // chunk ends at or before the window start
  After,            // chunk starts at or after the window end
  CoversRemainder,  // chunk holds the whole rest of the window
  Suffix,           // window starts inside the chunk and runs past its end
  Prefix,           // window started earlier and ends inside the chunk
  Inside            // chunk lies entirely within the window
};

const char* to_string(Overlap overlap);

// State carried by the fold from one chunk to the next
struct RangeState {
  uint64_t remaining_offset = 0;  // absolute offset of the first unserved byte
  uint64_t chunk_start = 0;       // absolute offset of the current chunk
  uint64_t remaining_length = 0;  // bytes still to serve
};

Overlap classify(const RangeState& state, uint64_t chunk_length);

// Folds one chunk into the state, appending any fragment it contributes to out
void fold_chunk(RangeState& state, std::string_view chunk, std::vector<std::string_view>& out);

// Returns the fragments of chunks (laid end to end) covering [offset, offset + length).
// A window past the end yields a short or empty result; never throws.
// Fragments point into the chunk buffers and live as long as they do.
std::vector<std::string_view> read_range(const std::vector<std::string_view>& chunks,
                                         uint64_t offset, uint64_t length);

// Resolves a file's fingerprints to views of the stored chunk bytes.
// Throws UnknownChunkError on a dangling fingerprint.
std::vector<std::string_view> resolve_chunks(const store::ChunkStore& chunk_store,
                                             const store::FileEntry& entry);
// Same, for entry.chunks[first, last) only. last is capped at the chunk count.
std::vector<std::string_view> resolve_chunks(const store::ChunkStore& chunk_store,
                                             const store::FileEntry& entry,
                                             size_t first, size_t last);

} // namespace range
} // namespace crunch

#endif // CRUNCH_RANGE_READER_HPP
