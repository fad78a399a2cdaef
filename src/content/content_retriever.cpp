#include "content/content_retriever.hpp"
#include <condition_variable>
#include <exception>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <boost/log/trivial.hpp>
#include "content/manifest.hpp"
#include "crypto/hash.hpp"

namespace dsb {
namespace content {

namespace {

// Fetches one chunk and checks that its data hashes to the requested id
Chunk fetch_verified_chunk(Retriever& retriever, const Cid& chunk_id) {
  Chunk chunk;
  try {
    chunk = retriever.fetch_chunk(chunk_id);
  }
  catch (const Error& e) {
    throw Error::wrap_current(e.kind(), "Content retriever: Failed to fetch chunk " + chunk_id, chunk_id);
  }
  catch (const std::exception&) {
    throw Error::wrap_current(ErrorKind::UNAVAILABLE, "Content retriever: Failed to fetch chunk " + chunk_id, chunk_id);
  }

  if (crypto::sha256_hex(chunk.data) != chunk_id) {
    BOOST_LOG_TRIVIAL(error) << "Content retriever: Chunk " << chunk_id << " failed integrity check";
    throw Error(ErrorKind::CHUNK_INTEGRITY_MISMATCH,
                "Content retriever: Chunk data does not match its id " + chunk_id, chunk_id);
  }

  chunk.id = chunk_id;
  chunk.size = chunk.data.size();
  return chunk;
}

using Clock = std::chrono::steady_clock;

// Progress of one fan-out, shared with fetch tasks that may outlive the call
struct ParallelFetch {
  explicit ParallelFetch(size_t count) : chunks(count), started(count), remaining(count) {}

  std::mutex mutex;
  std::condition_variable changed;
  std::vector<std::optional<Chunk>> chunks;
  std::vector<std::optional<Clock::time_point>> started;
  size_t remaining;
  std::exception_ptr first_error;
  bool aborted = false;
};

} // namespace

//==============================================
// CONSTRUCTOR
//==============================================

ContentRetriever::ContentRetriever(std::shared_ptr<Retriever> retriever,
                                   std::shared_ptr<utils::WorkerPool> pool,
                                   std::chrono::milliseconds fetch_timeout)
  : retriever_(std::move(retriever))
  , pool_(std::move(pool))
  , fetch_timeout_(fetch_timeout) {
  if (!retriever_) {
    throw std::invalid_argument("Content retriever: Retriever must not be null");
  }
  if (fetch_timeout_.count() < 0) {
    throw std::invalid_argument("Content retriever: Fetch timeout must not be negative");
  }
}

//==============================================
// RETRIEVAL
//==============================================

Bytes ContentRetriever::retrieve(const ManifestId& manifest_id) {
  return retrieve_verified(manifest_id).data;
}

RetrievedContent ContentRetriever::retrieve_verified(const ManifestId& manifest_id) {
  BOOST_LOG_TRIVIAL(info) << "Content retriever: Retrieving manifest " << manifest_id;

  RetrievedContent result;
  result.manifest = fetch_manifest(manifest_id);
  const Manifest& manifest = result.manifest;

  // Empty content is only valid when the manifest says so
  if (manifest.chunk_ids.empty()) {
    if (manifest.total_size != 0) {
      BOOST_LOG_TRIVIAL(error) << "Content retriever: Manifest " << manifest_id
                               << " lists no chunks but claims " << manifest.total_size << " bytes";
      throw Error(ErrorKind::INCONSISTENT_MANIFEST,
                  "Content retriever: Manifest has no chunks but a non-zero total size", manifest_id);
    }
    BOOST_LOG_TRIVIAL(debug) << "Content retriever: Manifest " << manifest_id << " describes empty content";
  }
  else if (pool_ && manifest.chunk_ids.size() > 1) {
    result.chunks = fetch_chunks_parallel(manifest);
  }
  else {
    result.chunks = fetch_chunks_sequential(manifest);
  }

  result.data = reassemble(manifest, result.chunks);

  BOOST_LOG_TRIVIAL(info) << "Content retriever: Retrieved " << result.data.size() << " bytes for manifest "
                          << manifest_id;
  return result;
}

//==============================================
// PIPELINE STAGES
//==============================================

Manifest ContentRetriever::fetch_manifest(const ManifestId& manifest_id) {
  Manifest manifest;
  try {
    manifest = retriever_->fetch_manifest(manifest_id);
  }
  catch (const Error& e) {
    if (e.kind() != ErrorKind::NOT_FOUND && e.kind() != ErrorKind::MANIFEST_NOT_FOUND) {
      throw;
    }
    BOOST_LOG_TRIVIAL(warning) << "Content retriever: Manifest " << manifest_id << " not found";
    throw Error::wrap_current(ErrorKind::MANIFEST_NOT_FOUND,
                              "Content retriever: Failed to fetch manifest " + manifest_id, manifest_id);
  }

  // A manifest without an id is treated as absent
  if (manifest.id.empty()) {
    throw Error(ErrorKind::MANIFEST_NOT_FOUND, "Content retriever: Backend returned an empty manifest", manifest_id);
  }
  if (manifest.id != manifest_id || !verify_manifest_id(manifest)) {
    BOOST_LOG_TRIVIAL(error) << "Content retriever: Manifest " << manifest_id << " does not match its id";
    throw Error(ErrorKind::INCONSISTENT_MANIFEST, "Content retriever: Manifest does not match its id", manifest_id);
  }
  return manifest;
}

std::vector<Chunk> ContentRetriever::fetch_chunks_sequential(const Manifest& manifest) {
  std::vector<Chunk> chunks;
  chunks.reserve(manifest.chunk_ids.size());
  for (const auto& chunk_id : manifest.chunk_ids) {
    chunks.push_back(fetch_verified_chunk(*retriever_, chunk_id));
  }
  return chunks;
}

std::vector<Chunk> ContentRetriever::fetch_chunks_parallel(const Manifest& manifest) {
  BOOST_LOG_TRIVIAL(debug) << "Content retriever: Fetching " << manifest.chunk_ids.size() << " chunks across "
                           << pool_->size() << " workers";

  auto state = std::make_shared<ParallelFetch>(manifest.chunk_ids.size());
  for (size_t i = 0; i < manifest.chunk_ids.size(); ++i) {
    auto retriever = retriever_;
    const Cid chunk_id = manifest.chunk_ids[i];
    pool_->post([retriever, state, chunk_id, i]() {
      {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->aborted) {
          return;
        }
        state->started[i] = Clock::now();
      }
      state->changed.notify_all();

      std::optional<Chunk> chunk;
      std::exception_ptr error;
      try {
        chunk = fetch_verified_chunk(*retriever, chunk_id);
      }
      catch (const std::exception&) {
        error = std::current_exception();
      }

      std::lock_guard<std::mutex> lock(state->mutex);
      if (error) {
        if (!state->first_error) {
          state->first_error = error;
          state->aborted = true;
        }
      }
      else {
        state->chunks[i] = std::move(chunk);
      }
      --state->remaining;
      state->changed.notify_all();
    });
  }

  // Wait for every chunk, the first failure, or the earliest running fetch to overrun
  std::unique_lock<std::mutex> lock(state->mutex);
  while (state->remaining > 0 && !state->first_error) {
    std::optional<Clock::time_point> deadline;
    size_t slowest = 0;
    if (fetch_timeout_.count() > 0) {
      for (size_t i = 0; i < state->started.size(); ++i) {
        if (state->started[i] && !state->chunks[i] && (!deadline || *state->started[i] + fetch_timeout_ < *deadline)) {
          deadline = *state->started[i] + fetch_timeout_;
          slowest = i;
        }
      }
    }
    if (!deadline) {
      state->changed.wait(lock);
      continue;
    }

    state->changed.wait_until(lock, *deadline);
    if (Clock::now() >= *deadline && !state->first_error && !state->chunks[slowest]) {
      state->aborted = true;
      const Cid& chunk_id = manifest.chunk_ids[slowest];
      BOOST_LOG_TRIVIAL(error) << "Content retriever: Timed out after " << fetch_timeout_.count()
                               << " ms waiting for chunk " << chunk_id;
      throw Error(ErrorKind::TIMEOUT, "Content retriever: Timed out fetching chunk " + chunk_id, chunk_id);
    }
  }

  if (state->first_error) {
    std::exception_ptr error = state->first_error;
    lock.unlock();
    try {
      std::rethrow_exception(error);
    }
    catch (const Error& e) {
      BOOST_LOG_TRIVIAL(error) << "Content retriever: Aborting retrieval: " << e.what();
      throw;
    }
  }

  // Manifest order, regardless of completion order
  std::vector<Chunk> chunks;
  chunks.reserve(state->chunks.size());
  for (auto& chunk : state->chunks) {
    chunks.push_back(std::move(*chunk));
  }
  return chunks;
}

Bytes ContentRetriever::reassemble(const Manifest& manifest, const std::vector<Chunk>& chunks) {
  size_t assembled_size = 0;
  for (const auto& chunk : chunks) {
    assembled_size += chunk.data.size();
  }

  Bytes data;
  data.reserve(assembled_size);
  for (const auto& chunk : chunks) {
    data.insert(data.end(), chunk.data.begin(), chunk.data.end());
  }

  if (data.size() != manifest.total_size) {
    BOOST_LOG_TRIVIAL(error) << "Content retriever: Reassembled " << data.size() << " bytes, manifest "
                             << manifest.id << " expects " << manifest.total_size;
    throw Error(ErrorKind::SIZE_MISMATCH, "Content retriever: Reassembled size " + std::to_string(data.size()) +
                " does not match manifest total size " + std::to_string(manifest.total_size), manifest.id);
  }

  if (crypto::sha256_hex(data) != manifest.content_id) {
    BOOST_LOG_TRIVIAL(error) << "Content retriever: Content hash mismatch for manifest " << manifest.id;
    throw Error(ErrorKind::CONTENT_INTEGRITY_MISMATCH,
                "Content retriever: Reassembled content does not match " + manifest.content_id, manifest.id);
  }
  return data;
}

} // namespace content
} // namespace dsb
