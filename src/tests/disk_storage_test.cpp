#include <gtest/gtest.h>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include "content/chunker.hpp"
#include "content/manifest.hpp"
#include "crypto/hash.hpp"
#include "store/disk_storage.hpp"
#include "test_utils.hpp"

using namespace dsb;
using namespace dsb::content;
using namespace dsb::store;

class DiskStorageTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  std::unique_ptr<DiskStorage> storage;

  void SetUp() override {
    test_dir = make_temp_dir("disk_storage_test");
    ASSERT_TRUE(std::filesystem::exists(test_dir));
    storage = std::make_unique<DiskStorage>(test_dir);
  }

  void TearDown() override {
    storage.reset();
    std::error_code ec;
    std::filesystem::remove_all(test_dir, ec);
  }

  // Helper methods to reduce repetition
  Chunk store_and_verify(const std::string& text) {
    Chunk chunk = make_chunk(to_bytes(text));
    EXPECT_NO_THROW(storage->store_chunk(chunk)) << "Failed to store chunk for: " << text;
    EXPECT_TRUE(storage->has_chunk(chunk.id));
    EXPECT_EQ(storage->get_chunk(chunk.id), chunk) << "Data mismatch for: " << text;
    return chunk;
  }

  void expect_kind(const std::function<void()>& action, ErrorKind kind) {
    try {
      action();
      ADD_FAILURE() << "Expected " << error_kind_to_string(kind);
    }
    catch (const Error& e) {
      EXPECT_EQ(e.kind(), kind) << e.what();
    }
  }
};

TEST_F(DiskStorageTest, BasicOperations) {
  store_and_verify("Hello, Store!");
  store_and_verify("");
}

TEST_F(DiskStorageTest, UsesContentAddressedLayout) {
  Chunk chunk = store_and_verify("layout");
  auto expected = test_dir / "chunks" / chunk.id.substr(0, 2) / chunk.id.substr(2, 2) /
                  chunk.id.substr(4, 2) / chunk.id.substr(6);
  EXPECT_TRUE(std::filesystem::exists(expected));
}

TEST_F(DiskStorageTest, ManifestRoundTrip) {
  Chunk a = store_and_verify("first part ");
  Chunk b = store_and_verify("second part");
  Manifest manifest = make_manifest("0123456789abcdef0123456789abcdef0123456789abcdef0123456789abcdef",
                                    {a.id, b.id}, a.size + b.size);
  storage->store_manifest(manifest);
  EXPECT_TRUE(storage->has_manifest(manifest.id));
  EXPECT_EQ(storage->get_manifest(manifest.id), manifest);
}

TEST_F(DiskStorageTest, MissingKeysThrowNotFound) {
  const std::string id = crypto::sha256_hex(std::string("never stored"));
  EXPECT_FALSE(storage->has_chunk(id));
  expect_kind([&]() { storage->get_chunk(id); }, ErrorKind::NOT_FOUND);
  expect_kind([&]() { storage->get_manifest(id); }, ErrorKind::NOT_FOUND);
}

TEST_F(DiskStorageTest, RejectsMalformedIds) {
  std::vector<std::string> bad_ids = {
    "",
    "../path/traversal",
    std::string(64, 'Z'),
    "/absolute/path"
  };
  for (const auto& id : bad_ids) {
    EXPECT_FALSE(storage->has_chunk(id));
    expect_kind([&]() { storage->get_chunk(id); }, ErrorKind::INVALID_ARGUMENT);
    Chunk chunk;
    chunk.id = id;
    expect_kind([&]() { storage->store_chunk(chunk); }, ErrorKind::INVALID_ARGUMENT);
  }
}

TEST_F(DiskStorageTest, CorruptManifestRecordIsInconsistent) {
  Manifest manifest = make_manifest(crypto::sha256_hex(std::string("x")), {}, 0);
  storage->store_manifest(manifest);

  auto path = test_dir / "manifests" / manifest.id.substr(0, 2) / manifest.id.substr(2, 2) /
              manifest.id.substr(4, 2) / manifest.id.substr(6);
  {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file << "garbage";
  }
  expect_kind([&]() { storage->get_manifest(manifest.id); }, ErrorKind::INCONSISTENT_MANIFEST);
}

TEST_F(DiskStorageTest, SurvivesReopen) {
  Chunk chunk = store_and_verify("persistent");
  storage = std::make_unique<DiskStorage>(test_dir);
  EXPECT_EQ(storage->get_chunk(chunk.id), chunk);
}

TEST_F(DiskStorageTest, ClearRemovesEverything) {
  Chunk chunk = store_and_verify("temp_data");
  ASSERT_NO_THROW(storage->clear());
  EXPECT_FALSE(storage->has_chunk(chunk.id));
  store_and_verify("usable after clear");
}

TEST_F(DiskStorageTest, LargeChunk) {
  store_and_verify(std::string(1024 * 1024, 'X'));
}

TEST_F(DiskStorageTest, ConcurrentAccess) {
  const size_t num_threads = 5;
  const size_t ops_per_thread = 50;
  std::atomic<size_t> successful_ops{0};
  std::vector<std::thread> threads;

  for (size_t i = 0; i < num_threads; ++i) {
    threads.emplace_back([this, i, ops_per_thread, &successful_ops]() {
      for (size_t j = 0; j < ops_per_thread; ++j) {
        // Every thread also writes one shared chunk to race on the same key
        Chunk shared = make_chunk(to_bytes("shared"));
        Chunk own = make_chunk(to_bytes("concurrent_" + std::to_string(i) + "_" + std::to_string(j)));
        try {
          storage->store_chunk(shared);
          storage->store_chunk(own);
          if (storage->get_chunk(own.id) == own && storage->get_chunk(shared.id) == shared) {
            successful_ops++;
          }
        } catch (const std::exception& e) {
          ADD_FAILURE() << "Thread " << i << " failed: " << e.what();
        }
      }
    });
  }

  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(successful_ops, num_threads * ops_per_thread);
}

TEST_F(DiskStorageTest, UninspectablePathIsIoError) {
  Chunk chunk = make_chunk(to_bytes("behind a symlink loop"));

  // chunks/<prefix> points at itself, so resolving anything below it fails with ELOOP
  std::filesystem::path prefix_dir = test_dir / "chunks" / chunk.id.substr(0, 2);
  std::filesystem::create_symlink(prefix_dir.filename(), prefix_dir);

  expect_kind([&]() { storage->has_chunk(chunk.id); }, ErrorKind::IO);
  expect_kind([&]() { storage->get_chunk(chunk.id); }, ErrorKind::IO);
  EXPECT_FALSE(storage->has_manifest(chunk.id));
}
