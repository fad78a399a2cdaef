#pragma once

#include <memory>
#include "content/chunker.hpp"
#include "content/manifest.hpp"
#include "store/storage.hpp"
#include "utils/worker_pool.hpp"

namespace dsb {
namespace content {

// Chunks content, stores every chunk, then stores the manifest describing them.
// A failed chunk store aborts the publish before any manifest is written;
// chunks already stored are left behind since they are content-addressed.
class Publisher {
public:

  // ---- CONSTRUCTOR ----
  // With a pool, chunk stores fan out across its workers and are joined before
  // the manifest is built; without one they run sequentially.
  Publisher(Chunker chunker, std::shared_ptr<store::Storage> storage,
            std::shared_ptr<utils::WorkerPool> pool = nullptr);


  // ---- PUBLISHING ----
  // Returns the id of the stored manifest
  ManifestId publish(const Bytes& data);
  // Same as publish but returns the full manifest
  Manifest publish_manifest(const Bytes& data);


  // ---- GETTERS ----
  const Chunker& chunker() const { return chunker_; }

private:
  // ---- PARAMETERS ----
  Chunker chunker_;
  std::shared_ptr<store::Storage> storage_;
  std::shared_ptr<utils::WorkerPool> pool_;


  // ---- CHUNK STORAGE ----
  void store_chunks_sequential(const std::vector<Chunk>& chunks);
  void store_chunks_parallel(const std::vector<Chunk>& chunks);
};

} // namespace content
} // namespace dsb
