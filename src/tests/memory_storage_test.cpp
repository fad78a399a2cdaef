#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>
#include "content/chunker.hpp"
#include "content/manifest.hpp"
#include "store/memory_storage.hpp"

using namespace dsb;
using namespace dsb::content;
using namespace dsb::store;

TEST(InMemoryStorageTest, StoresAndReturnsChunksAndManifests) {
  InMemoryStorage storage;
  Chunk chunk = make_chunk(to_bytes("chunk data"));
  Manifest manifest = make_manifest(chunk.id, {chunk.id}, chunk.size);

  storage.store_chunk(chunk);
  storage.store_manifest(manifest);

  EXPECT_EQ(storage.get_chunk(chunk.id), chunk);
  EXPECT_EQ(storage.get_manifest(manifest.id), manifest);
  EXPECT_TRUE(storage.has_chunk(chunk.id));
  EXPECT_TRUE(storage.has_manifest(manifest.id));
}

TEST(InMemoryStorageTest, MissingKeysThrowNotFound) {
  InMemoryStorage storage;
  try {
    storage.get_chunk("deadbeef");
    FAIL() << "Expected NOT_FOUND";
  }
  catch (const Error& e) {
    EXPECT_EQ(e.kind(), ErrorKind::NOT_FOUND);
    EXPECT_EQ(e.subject(), "deadbeef");
  }
  EXPECT_THROW(storage.get_manifest("deadbeef"), Error);
}

TEST(InMemoryStorageTest, StoringSameChunkTwiceIsIdempotent) {
  InMemoryStorage storage;
  Chunk chunk = make_chunk(to_bytes("same"));
  storage.store_chunk(chunk);
  storage.store_chunk(chunk);
  EXPECT_EQ(storage.chunk_count(), 1u);
  EXPECT_EQ(storage.get_chunk(chunk.id), chunk);
}

TEST(InMemoryStorageTest, IndependentInstancesShareNothing) {
  InMemoryStorage first;
  InMemoryStorage second;
  Chunk chunk = make_chunk(to_bytes("only in first"));
  first.store_chunk(chunk);
  EXPECT_TRUE(first.has_chunk(chunk.id));
  EXPECT_FALSE(second.has_chunk(chunk.id));
}

TEST(InMemoryStorageTest, ConcurrentReadersAndWriters) {
  InMemoryStorage storage;
  std::vector<Chunk> chunks;
  for (int i = 0; i < 64; ++i) {
    chunks.push_back(make_chunk(to_bytes("chunk-" + std::to_string(i))));
  }

  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&storage, &chunks, t]() {
      for (std::size_t i = t; i < chunks.size(); i += 4) {
        storage.store_chunk(chunks[i]);
        EXPECT_EQ(storage.get_chunk(chunks[i].id), chunks[i]);
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  EXPECT_EQ(storage.chunk_count(), chunks.size());
}
