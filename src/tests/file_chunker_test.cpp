#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <atomic>
#include <sstream>
#include <thread>
#include <vector>
#include "chunker/file_chunker.hpp"
#include "test_utils.hpp"

using namespace crunch::chunker;
using namespace crunch::store;

class FileChunkerTest : public ::testing::Test {
protected:
  ChunkStore store;
  FileRegistry registry;
  FileChunker chunker{store, registry};

  void SetUp() override {
    init_logging();
  }

  // Checks the size and layout invariants of an entry against its source bytes
  void expect_complete(const FileEntry& entry, const std::string& data, size_t sector = SECTOR_SIZE) {
    ASSERT_EQ(entry.size, data.size());
    uint64_t total = 0;
    for (size_t i = 0; i < entry.chunks.size(); ++i) {
      const Chunk& chunk = store.get(entry.chunks[i]);
      EXPECT_EQ(chunk, data.substr(i * sector, sector)) << "Chunk " << i << " content mismatch";
      if (i + 1 < entry.chunks.size()) {
        EXPECT_EQ(chunk.size(), sector) << "Inner chunk " << i << " is short";
      } else {
        EXPECT_GT(chunk.size(), 0u);
        EXPECT_LE(chunk.size(), sector);
      }
      total += chunk.size();
    }
    EXPECT_EQ(total, data.size());
    EXPECT_EQ(entry.chunks.empty(), data.empty());
  }
};

TEST_F(FileChunkerTest, ChunkingCompleteness) {
  const std::vector<size_t> sizes = {0, 1, 4095, 4096, 4097, 8192, 10000, 65537};
  for (size_t size : sizes) {
    const std::string path = "file_" + std::to_string(size);
    const std::string data = make_bytes(size, static_cast<uint32_t>(size + 1));
    FileEntry entry = chunker.chunk_file(path, data);
    expect_complete(entry, data);
    EXPECT_EQ(entry.chunks.size(), (size + SECTOR_SIZE - 1) / SECTOR_SIZE);
  }
}

TEST_F(FileChunkerTest, TenThousandByteLayout) {
  const std::string data = make_bytes(10000, 5);
  FileEntry entry = chunker.chunk_file("ten_k", data);

  ASSERT_EQ(entry.chunks.size(), 3u);
  EXPECT_EQ(store.get(entry.chunks[0]).size(), 4096u);
  EXPECT_EQ(store.get(entry.chunks[1]).size(), 4096u);
  EXPECT_EQ(store.get(entry.chunks[2]).size(), 1808u);
}

TEST_F(FileChunkerTest, EntryIsRegistered) {
  const std::string data = make_bytes(5000, 2);
  FileEntry entry = chunker.chunk_file("dir/file.bin", data);

  auto registered = registry.lookup("dir/file.bin");
  ASSERT_TRUE(registered.has_value());
  EXPECT_EQ(registered->chunks, entry.chunks);
  EXPECT_EQ(registered->size, 5000u);
}

TEST_F(FileChunkerTest, SharedBlockIsStoredOnce) {
  const std::string shared = make_bytes(4096, 42);
  const std::string first = shared + "trailer one";
  const std::string second = shared + "trailer two!";

  FileEntry a = chunker.chunk_file("a.bin", first);
  FileEntry b = chunker.chunk_file("b.bin", second);

  EXPECT_EQ(a.chunks[0], b.chunks[0]);
  EXPECT_NE(a.chunks[1], b.chunks[1]);
  EXPECT_EQ(store.chunk_count(), 3u);
  EXPECT_EQ(store.stats().dedup_hits, 1u);
}

TEST_F(FileChunkerTest, RepeatedBlocksWithinOneFile) {
  const std::string block = make_bytes(4096, 8);
  FileEntry entry = chunker.chunk_file("repeat", block + block + block);

  ASSERT_EQ(entry.chunks.size(), 3u);
  EXPECT_EQ(store.chunk_count(), 1u);
  EXPECT_EQ(entry.size, 3u * 4096u);
}

TEST_F(FileChunkerTest, DuplicatePathRejectedBeforeStoring) {
  chunker.chunk_file("same", make_bytes(100, 1));
  size_t chunks_before = store.chunk_count();

  EXPECT_THROW(chunker.chunk_file("same", make_bytes(100, 2)), DuplicatePathError);
  EXPECT_EQ(store.chunk_count(), chunks_before);
  EXPECT_EQ(registry.file_count(), 1u);
}

TEST_F(FileChunkerTest, CustomSectorSize) {
  ChunkStore small_store;
  FileRegistry small_registry;
  FileChunker small(small_store, small_registry, ChunkerOptions{16});
  EXPECT_EQ(small.sector_size(), 16u);

  const std::string data = make_bytes(50, 3);
  FileEntry entry = small.chunk_file("small", data);
  ASSERT_EQ(entry.chunks.size(), 4u);
  EXPECT_EQ(small_store.get(entry.chunks[3]).size(), 2u);
}

TEST_F(FileChunkerTest, ZeroSectorSizeRejected) {
  EXPECT_THROW({ FileChunker rejected(store, registry, ChunkerOptions{0}); }, std::invalid_argument);
}

TEST_F(FileChunkerTest, ChunkStream) {
  const std::string data = make_bytes(9000, 11);
  std::stringstream input(data);

  FileEntry entry = chunker.chunk_stream("streamed", input);
  expect_complete(entry, data);

  std::stringstream bad;
  bad.setstate(std::ios::badbit);
  EXPECT_THROW(chunker.chunk_stream("bad", bad), std::runtime_error);
}

TEST_F(FileChunkerTest, ConcurrentChunkingClaimsEachPathOnce) {
  const size_t num_threads = 8;
  const std::string shared = make_bytes(2 * SECTOR_SIZE, 7);
  std::atomic<size_t> shared_wins{0};
  std::atomic<size_t> shared_rejects{0};
  std::vector<std::thread> threads;

  for (size_t i = 0; i < num_threads; ++i) {
    threads.emplace_back([this, i, &shared, &shared_wins, &shared_rejects]() {
      const std::string own = make_bytes(3 * SECTOR_SIZE, static_cast<uint32_t>(100 + i));
      chunker.chunk_file("file_" + std::to_string(i), own);
      try {
        chunker.chunk_file("shared", shared);
        ++shared_wins;
      } catch (const DuplicatePathError&) {
        ++shared_rejects;
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(shared_wins.load(), 1u);
  EXPECT_EQ(shared_rejects.load(), num_threads - 1);

  // Losers for the shared path never reached the store
  ChunkStoreStats stats = store.stats();
  EXPECT_EQ(stats.puts, 3 * num_threads + 2);
  EXPECT_EQ(stats.chunks, 3 * num_threads + 2);
  EXPECT_EQ(stats.dedup_hits, 0u);
  EXPECT_EQ(registry.file_count(), num_threads + 1);

  for (size_t i = 0; i < num_threads; ++i) {
    auto entry = registry.lookup("file_" + std::to_string(i));
    ASSERT_TRUE(entry.has_value());
    expect_complete(*entry, make_bytes(3 * SECTOR_SIZE, static_cast<uint32_t>(100 + i)));
  }
}

TEST(FileChunkerFailureTest, FailedChunkingReleasesPath) {
  init_logging();
  ::testing::MockFunction<crunch::crypto::Fingerprint(std::string_view)> fingerprint_fn;
  crunch::crypto::Fingerprint forced{};
  forced[0] = 0xcd;
  EXPECT_CALL(fingerprint_fn, Call(::testing::_)).WillRepeatedly(::testing::Return(forced));

  ChunkStore store(fingerprint_fn.AsStdFunction());
  FileRegistry registry;
  FileChunker chunker(store, registry);

  chunker.chunk_file("first", "same bytes");
  EXPECT_THROW(chunker.chunk_file("second", "other bytes"), CollisionError);
  EXPECT_FALSE(registry.contains("second"));

  // The failed path is free for a later attempt
  FileEntry retried = chunker.chunk_file("second", "same bytes");
  EXPECT_EQ(retried.chunks.size(), 1u);
  EXPECT_TRUE(registry.contains("second"));
}
