#include <gtest/gtest.h>
#include <string>
#include "content/chunker.hpp"
#include "crypto/hash.hpp"

using namespace dsb;
using namespace dsb::content;

TEST(ChunkerTest, EmptyInputYieldsNoChunks) {
  Chunker chunker(10);
  EXPECT_TRUE(chunker.chunk(Bytes{}).empty());
}

TEST(ChunkerTest, SplitsIntoFixedSizeChunksWithRemainder) {
  Chunker chunker(10);
  const Bytes data = to_bytes("Hello, Digisocialblock!");
  ASSERT_EQ(data.size(), 23u);

  auto chunks = chunker.chunk(data);
  ASSERT_EQ(chunks.size(), 3u);
  EXPECT_EQ(chunks[0].size, 10u);
  EXPECT_EQ(chunks[1].size, 10u);
  EXPECT_EQ(chunks[2].size, 3u);
  EXPECT_EQ(to_string(chunks[0].data), "Hello, Dig");
  EXPECT_EQ(to_string(chunks[2].data), "ck!");

  for (const auto& chunk : chunks) {
    EXPECT_EQ(chunk.id, crypto::sha256_hex(chunk.data));
    EXPECT_TRUE(verify_chunk(chunk));
  }
}

TEST(ChunkerTest, DeterministicForSamePolicy) {
  const Bytes data(5000, 0x5a);
  EXPECT_EQ(Chunker(1024).chunk(data), Chunker(1024).chunk(data));
}

TEST(ChunkerTest, ExactMultipleHasNoEmptyTail) {
  auto chunks = Chunker(4).chunk(Bytes(8, 1));
  ASSERT_EQ(chunks.size(), 2u);
  EXPECT_EQ(chunks[1].size, 4u);
}

TEST(ChunkerTest, ZeroChunkSizeFallsBackToDefault) {
  Chunker chunker(0);
  EXPECT_EQ(chunker.chunk_size(), Chunker::DEFAULT_CHUNK_SIZE);
}

TEST(ChunkerTest, VerifyChunkDetectsTampering) {
  Chunk chunk = make_chunk(to_bytes("payload"));
  chunk.data[0] ^= 0xff;
  EXPECT_FALSE(verify_chunk(chunk));
}
