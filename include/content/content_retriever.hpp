#pragma once

#include <chrono>
#include <memory>
#include <vector>
#include "content/chunk.hpp"
#include "content/retriever.hpp"
#include "utils/worker_pool.hpp"

namespace dsb {
namespace content {

// Result of a verified retrieval: the manifest, the chunks in manifest order
// and the reassembled bytes.
struct RetrievedContent {
  Manifest manifest;
  std::vector<Chunk> chunks;
  Bytes data;
};

// Reassembles content from a manifest id, verifying every layer:
// the manifest, each chunk against its id, the total size and the content hash.
// Any failed check aborts the call; no partial content is ever returned.
class ContentRetriever {
public:

  // ---- CONSTRUCTOR ----
  // With a pool, chunk fetches fan out across its workers and the first failure
  // aborts the retrieval. fetch_timeout bounds each fetch from the moment it
  // starts running in that mode; zero means wait indefinitely.
  explicit ContentRetriever(std::shared_ptr<Retriever> retriever,
                            std::shared_ptr<utils::WorkerPool> pool = nullptr,
                            std::chrono::milliseconds fetch_timeout = std::chrono::milliseconds(0));


  // ---- RETRIEVAL ----
  Bytes retrieve(const ManifestId& manifest_id);
  RetrievedContent retrieve_verified(const ManifestId& manifest_id);


  // ---- GETTERS ----
  std::chrono::milliseconds fetch_timeout() const { return fetch_timeout_; }

private:
  // ---- PARAMETERS ----
  std::shared_ptr<Retriever> retriever_;
  std::shared_ptr<utils::WorkerPool> pool_;
  std::chrono::milliseconds fetch_timeout_;


  // ---- PIPELINE STAGES ----
  Manifest fetch_manifest(const ManifestId& manifest_id);
  std::vector<Chunk> fetch_chunks_sequential(const Manifest& manifest);
  std::vector<Chunk> fetch_chunks_parallel(const Manifest& manifest);
  static Bytes reassemble(const Manifest& manifest, const std::vector<Chunk>& chunks);
};

} // namespace content
} // namespace dsb
