#include "range/range_reader.hpp"
#include <algorithm>
#include <limits>
#include <boost/log/trivial.hpp>

namespace crunch {
namespace range {

namespace {

// End of the unserved window, saturating instead of wrapping
uint64_t window_end(const RangeState& state) {
  const uint64_t max = std::numeric_limits<uint64_t>::max();
  if (max - state.remaining_offset < state.remaining_length) {
    return max;
  }
  return state.remaining_offset + state.remaining_length;
}

} // namespace

const char* to_string(Overlap overlap) {
  switch (overlap) {
    case Overlap::Satisfied:       return "satisfied";
    case Overlap::Before:          return "before";
    case Overlap::After:           return "after";
    case Overlap::CoversRemainder: return "covers-remainder";
    case Overlap::Suffix:          return "suffix";
    case Overlap::Prefix:          return "prefix";
    case Overlap::Inside:          return "inside";
  }
  return "unknown";
}


//==============================================
// CLASSIFICATION
//==============================================

Overlap classify(const RangeState& state, uint64_t chunk_length) {
  if (state.remaining_length == 0) {
    return Overlap::Satisfied;
  }

  const uint64_t chunk_end = state.chunk_start + chunk_length;
  const uint64_t end = window_end(state);

  if (chunk_end <= state.remaining_offset) {
    return Overlap::Before;
  }
  if (state.chunk_start >= end) {
    return Overlap::After;
  }

  // The chunk overlaps the window from here on
  if (state.chunk_start <= state.remaining_offset) {
    return chunk_end >= end ? Overlap::CoversRemainder : Overlap::Suffix;
  }
  return chunk_end <= end ? Overlap::Inside : Overlap::Prefix;
}


//==============================================
// FOLD
//==============================================

void fold_chunk(RangeState& state, std::string_view chunk, std::vector<std::string_view>& out) {
  std::string_view fragment;

  switch (classify(state, chunk.size())) {
    case Overlap::Satisfied:
    case Overlap::Before:
    case Overlap::After:
      break;
    case Overlap::CoversRemainder:
      fragment = chunk.substr(state.remaining_offset - state.chunk_start, state.remaining_length);
      break;
    case Overlap::Suffix:
      fragment = chunk.substr(state.remaining_offset - state.chunk_start);
      break;
    case Overlap::Prefix:
      fragment = chunk.substr(0, window_end(state) - state.chunk_start);
      break;
    case Overlap::Inside:
      fragment = chunk;
      break;
  }

  if (!fragment.empty()) {
    out.push_back(fragment);
  }

  state.chunk_start += chunk.size();
  state.remaining_offset += fragment.size();
  state.remaining_length -= fragment.size();
}

std::vector<std::string_view> read_range(const std::vector<std::string_view>& chunks,
                                         uint64_t offset, uint64_t length) {
  std::vector<std::string_view> fragments;
  RangeState state{offset, 0, length};

  for (const auto& chunk : chunks) {
    if (state.remaining_length == 0) {
      break;
    }
    fold_chunk(state, chunk, fragments);
  }

  BOOST_LOG_TRIVIAL(trace) << "RangeReader: Window [" << offset << ", +" << length << ") served by "
                           << fragments.size() << " fragments, " << (length - state.remaining_length)
                           << " bytes";
  return fragments;
}


//==============================================
// RESOLUTION
//==============================================

std::vector<std::string_view> resolve_chunks(const store::ChunkStore& chunk_store,
                                             const store::FileEntry& entry) {
  return resolve_chunks(chunk_store, entry, 0, entry.chunks.size());
}

std::vector<std::string_view> resolve_chunks(const store::ChunkStore& chunk_store,
                                             const store::FileEntry& entry,
                                             size_t first, size_t last) {
  std::vector<std::string_view> chunks;
  last = std::min(last, entry.chunks.size());
  if (first >= last) {
    return chunks;
  }
  chunks.reserve(last - first);
  for (size_t i = first; i < last; ++i) {
    chunks.emplace_back(chunk_store.get(entry.chunks[i]));
  }
  return chunks;
}

} // namespace range
} // namespace crunch
