#include "content/publisher.hpp"
#include <future>
#include <stdexcept>
#include <utility>
#include <boost/log/trivial.hpp>
#include "crypto/hash.hpp"

namespace dsb {
namespace content {

namespace {

// Stores one chunk, adding the chunk id as context to any failure. The kind of
// a typed storage error is kept so callers can still tell transient failures.
void store_one(store::Storage& storage, const Chunk& chunk) {
  try {
    storage.store_chunk(chunk);
  }
  catch (const Error& e) {
    throw Error::wrap_current(e.kind(), "Publisher: Failed to store chunk " + chunk.id, chunk.id);
  }
  catch (const std::exception&) {
    throw Error::wrap_current(ErrorKind::UNAVAILABLE, "Publisher: Failed to store chunk " + chunk.id, chunk.id);
  }
}

} // namespace

//==============================================
// CONSTRUCTOR
//==============================================

Publisher::Publisher(Chunker chunker, std::shared_ptr<store::Storage> storage,
                     std::shared_ptr<utils::WorkerPool> pool)
  : chunker_(std::move(chunker))
  , storage_(std::move(storage))
  , pool_(std::move(pool)) {
  if (!storage_) {
    throw std::invalid_argument("Publisher: Storage must not be null");
  }
  BOOST_LOG_TRIVIAL(info) << "Publisher: Initialized with chunk size " << chunker_.chunk_size()
                          << (pool_ ? " and parallel chunk storage" : "");
}

//==============================================
// PUBLISHING
//==============================================

ManifestId Publisher::publish(const Bytes& data) {
  return publish_manifest(data).id;
}

Manifest Publisher::publish_manifest(const Bytes& data) {
  BOOST_LOG_TRIVIAL(info) << "Publisher: Publishing " << data.size() << " bytes";

  // 1. Hash the full content
  const Cid content_id = crypto::sha256_hex(data);

  // 2. Split into ordered chunks
  std::vector<Chunk> chunks = chunker_.chunk(data);

  // 3. Store every chunk; any failure aborts before a manifest exists
  if (pool_ && chunks.size() > 1) {
    store_chunks_parallel(chunks);
  } else {
    store_chunks_sequential(chunks);
  }

  // 4. Build the manifest from the chunk id sequence
  std::vector<Cid> chunk_ids;
  chunk_ids.reserve(chunks.size());
  for (const auto& chunk : chunks) {
    chunk_ids.push_back(chunk.id);
  }
  Manifest manifest = make_manifest(content_id, chunk_ids, data.size());

  // 5. Store the manifest
  try {
    storage_->store_manifest(manifest);
  }
  catch (const Error& e) {
    BOOST_LOG_TRIVIAL(error) << "Publisher: Failed to store manifest " << manifest.id << ": " << e.what();
    throw Error::wrap_current(e.kind(), "Publisher: Failed to store manifest " + manifest.id, manifest.id);
  }

  BOOST_LOG_TRIVIAL(info) << "Publisher: Published content " << content_id << " as manifest "
                          << manifest.id << " (" << chunks.size() << " chunks)";
  return manifest;
}

//==============================================
// CHUNK STORAGE
//==============================================

void Publisher::store_chunks_sequential(const std::vector<Chunk>& chunks) {
  for (const auto& chunk : chunks) {
    store_one(*storage_, chunk);
  }
}

void Publisher::store_chunks_parallel(const std::vector<Chunk>& chunks) {
  BOOST_LOG_TRIVIAL(debug) << "Publisher: Storing " << chunks.size() << " chunks across "
                           << pool_->size() << " workers";

  std::vector<std::future<void>> pending;
  pending.reserve(chunks.size());
  for (const auto& chunk : chunks) {
    auto storage = storage_;
    pending.push_back(pool_->submit([storage, &chunk]() { store_one(*storage, chunk); }));
  }

  // Join every task before reporting, since they reference chunks
  for (auto& future : pending) {
    future.wait();
  }
  for (auto& future : pending) {
    future.get();
  }
}

} // namespace content
} // namespace dsb
