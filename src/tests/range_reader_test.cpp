#include <gtest/gtest.h>
#include <limits>
#include <set>
#include <string>
#include <vector>
#include "range/range_reader.hpp"
#include "test_utils.hpp"

using namespace crunch::range;

namespace {

// Splits data into sector sized views the way the chunker lays a file out
std::vector<std::string_view> split(const std::string& data, size_t sector = 4096) {
  std::vector<std::string_view> chunks;
  for (size_t idx = 0; idx < data.size(); idx += sector) {
    chunks.emplace_back(std::string_view(data).substr(idx, sector));
  }
  return chunks;
}

} // namespace

class RangeReaderTest : public ::testing::Test {
protected:
  std::string data = make_bytes(10000, 17);
  std::vector<std::string_view> chunks = split(data);
};


//==============================================
// CLASSIFICATION
//==============================================

TEST(OverlapTest, Satisfied) {
  EXPECT_EQ(classify(RangeState{0, 0, 0}, 100), Overlap::Satisfied);
  EXPECT_EQ(classify(RangeState{50, 0, 0}, 100), Overlap::Satisfied);
}

TEST(OverlapTest, Before) {
  EXPECT_EQ(classify(RangeState{100, 0, 10}, 50), Overlap::Before);
  // Chunk ending exactly where the window starts contributes nothing
  EXPECT_EQ(classify(RangeState{100, 0, 10}, 100), Overlap::Before);
}

TEST(OverlapTest, After) {
  EXPECT_EQ(classify(RangeState{0, 100, 10}, 10), Overlap::After);
  EXPECT_EQ(classify(RangeState{0, 10, 10}, 10), Overlap::After);
}

TEST(OverlapTest, CoversRemainder) {
  EXPECT_EQ(classify(RangeState{10, 0, 5}, 100), Overlap::CoversRemainder);
  EXPECT_EQ(classify(RangeState{0, 0, 100}, 100), Overlap::CoversRemainder);
}

TEST(OverlapTest, Suffix) {
  EXPECT_EQ(classify(RangeState{10, 0, 200}, 100), Overlap::Suffix);
}

TEST(OverlapTest, Prefix) {
  EXPECT_EQ(classify(RangeState{10, 50, 100}, 100), Overlap::Prefix);
}

TEST(OverlapTest, Inside) {
  EXPECT_EQ(classify(RangeState{10, 50, 100}, 20), Overlap::Inside);
  EXPECT_EQ(classify(RangeState{10, 50, 100}, 60), Overlap::Inside);
}

TEST(OverlapTest, Names) {
  EXPECT_STREQ(to_string(Overlap::CoversRemainder), "covers-remainder");
  EXPECT_STREQ(to_string(Overlap::Inside), "inside");
}


//==============================================
// FOLD STEPS
//==============================================

TEST(FoldChunkTest, SuffixThenCoversRemainder) {
  std::string first(10, 'a');
  std::string second(10, 'b');
  std::vector<std::string_view> out;
  RangeState state{7, 0, 6};

  fold_chunk(state, first, out);
  EXPECT_EQ(state.chunk_start, 10u);
  EXPECT_EQ(state.remaining_offset, 10u);
  EXPECT_EQ(state.remaining_length, 3u);

  fold_chunk(state, second, out);
  EXPECT_EQ(state.remaining_length, 0u);
  ASSERT_EQ(out.size(), 2u);
  EXPECT_EQ(out[0], "aaa");
  EXPECT_EQ(out[1], "bbb");
}

TEST(FoldChunkTest, PrefixAndInsideEmitFromChunkStart) {
  std::string chunk = "0123456789";
  std::vector<std::string_view> out;

  RangeState prefix{10, 50, 100};
  fold_chunk(prefix, chunk, out);
  EXPECT_EQ(out.back(), chunk);
  EXPECT_EQ(prefix.remaining_length, 90u);

  RangeState ending{45, 50, 8};
  fold_chunk(ending, chunk, out);
  EXPECT_EQ(out.back(), "012");
  EXPECT_EQ(ending.remaining_length, 5u);
}

TEST(FoldChunkTest, NonOverlappingChunkOnlyAdvances) {
  std::string chunk(10, 'x');
  std::vector<std::string_view> out;
  RangeState state{25, 0, 5};

  fold_chunk(state, chunk, out);
  EXPECT_TRUE(out.empty());
  EXPECT_EQ(state.chunk_start, 10u);
  EXPECT_EQ(state.remaining_offset, 25u);
  EXPECT_EQ(state.remaining_length, 5u);
}


//==============================================
// READ RANGE
//==============================================

TEST_F(RangeReaderTest, WindowAcrossChunkBoundary) {
  auto fragments = read_range(chunks, 4000, 200);

  ASSERT_EQ(fragments.size(), 2u);
  EXPECT_EQ(fragments[0], std::string_view(data).substr(4000, 96));
  EXPECT_EQ(fragments[1], std::string_view(data).substr(4096, 104));
  EXPECT_EQ(concat(fragments).size(), 200u);
}

TEST_F(RangeReaderTest, EmptyFile) {
  std::vector<std::string_view> none;
  EXPECT_TRUE(read_range(none, 0, 0).empty());
  EXPECT_TRUE(read_range(none, 5, 10).empty());
}

TEST_F(RangeReaderTest, WindowPastEndIsShort) {
  auto fragments = read_range(chunks, 9999, 50);

  ASSERT_EQ(fragments.size(), 1u);
  EXPECT_EQ(fragments[0], std::string_view(data).substr(9999, 1));
}

TEST_F(RangeReaderTest, ZeroLengthAndOffsetPastEnd) {
  EXPECT_TRUE(read_range(chunks, 0, 0).empty());
  EXPECT_TRUE(read_range(chunks, 5000, 0).empty());
  EXPECT_TRUE(read_range(chunks, 10000, 10).empty());
  EXPECT_TRUE(read_range(chunks, 20000, 10).empty());
}

TEST_F(RangeReaderTest, WholeFileReturnsChunksUnchanged) {
  auto fragments = read_range(chunks, 0, data.size());

  ASSERT_EQ(fragments.size(), chunks.size());
  for (size_t i = 0; i < chunks.size(); ++i) {
    EXPECT_EQ(static_cast<const void*>(fragments[i].data()), static_cast<const void*>(chunks[i].data())) << "Fragment " << i << " should alias its chunk";
    EXPECT_EQ(fragments[i].size(), chunks[i].size());
  }
}

TEST_F(RangeReaderTest, HugeLengthSaturates) {
  const uint64_t max = std::numeric_limits<uint64_t>::max();
  EXPECT_EQ(concat(read_range(chunks, 5, max)), data.substr(5));
  EXPECT_TRUE(read_range(chunks, max, 1).empty());
  EXPECT_TRUE(read_range(chunks, max, max).empty());
}

TEST_F(RangeReaderTest, Idempotent) {
  auto first = read_range(chunks, 1234, 5678);
  auto second = read_range(chunks, 1234, 5678);
  EXPECT_EQ(first, second);
}

TEST(RangeRoundTripTest, MatchesSourceSlice) {
  const std::vector<size_t> sizes = {0, 1, 100, 4095, 4096, 4097, 8192, 10000, 12289};
  const std::vector<uint64_t> offsets = {0, 1, 95, 4095, 4096, 4097, 8191, 8192, 9999, 10000, 12288, 20000};
  const std::vector<uint64_t> lengths = {0, 1, 2, 96, 4095, 4096, 4097, 8192, 10000, 50000};

  for (size_t size : sizes) {
    const std::string data = make_bytes(size, static_cast<uint32_t>(size));
    const auto chunks = split(data);
    for (uint64_t offset : offsets) {
      for (uint64_t length : lengths) {
        const std::string expected = offset >= size ? std::string() : data.substr(offset, length);
        EXPECT_EQ(concat(read_range(chunks, offset, length)), expected)
          << "size=" << size << " offset=" << offset << " length=" << length;
      }
    }
  }
}

TEST(RangeRoundTripTest, UnevenChunks) {
  // Chunk layouts other than the chunker's still reconstruct correctly
  std::vector<std::string> pieces = {"ab", "", "cdefg", "h", "ijklmnop"};
  std::vector<std::string_view> chunks(pieces.begin(), pieces.end());
  const std::string data = "abcdefghijklmnop";

  for (uint64_t offset = 0; offset <= data.size() + 2; ++offset) {
    for (uint64_t length = 0; length <= data.size() + 2; ++length) {
      const std::string expected = offset >= data.size() ? std::string() : data.substr(offset, length);
      auto fragments = read_range(chunks, offset, length);
      EXPECT_EQ(concat(fragments), expected) << "offset=" << offset << " length=" << length;
      for (const auto& fragment : fragments) {
        EXPECT_FALSE(fragment.empty());
      }
    }
  }
}

TEST(OverlapTest, EveryCaseHasItsOwnName) {
  const std::vector<Overlap> cases = {Overlap::Satisfied, Overlap::Before, Overlap::After,
                                      Overlap::CoversRemainder, Overlap::Suffix,
                                      Overlap::Prefix, Overlap::Inside};
  std::set<std::string> names;
  for (Overlap overlap : cases) {
    const std::string name = to_string(overlap);
    EXPECT_FALSE(name.empty());
    EXPECT_NE(name, "unknown");
    names.insert(name);
  }
  EXPECT_EQ(names.size(), cases.size());
}
