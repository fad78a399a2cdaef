#include "content/dds_service.hpp"
#include <utility>
#include <boost/log/trivial.hpp>

namespace dsb {
namespace content {

//==============================================
// CONSTRUCTOR
//==============================================

DdsService::DdsService(Chunker chunker, std::shared_ptr<store::Storage> local_storage,
                       std::shared_ptr<Retriever> remote,
                       std::shared_ptr<utils::WorkerPool> pool,
                       std::chrono::milliseconds fetch_timeout)
  : storage_(local_storage)
  , publisher_(std::move(chunker), local_storage, pool)
  , local_(std::make_shared<StorageRetriever>(local_storage), pool, fetch_timeout) {
  if (remote) {
    remote_ = std::make_unique<ContentRetriever>(std::move(remote), pool, fetch_timeout);
  }
  BOOST_LOG_TRIVIAL(info) << "DDS service: Ready" << (remote_ ? " with remote fallback" : "");
}

//==============================================
// OPERATIONS
//==============================================

ManifestId DdsService::publish(const Bytes& data) {
  return publisher_.publish(data);
}

Bytes DdsService::retrieve(const ManifestId& manifest_id) {
  if (manifest_id.empty()) {
    throw Error(ErrorKind::INVALID_ARGUMENT, "DDS service: Manifest id must not be empty");
  }

  try {
    return local_.retrieve(manifest_id);
  }
  catch (const Error& e) {
    // Only absence falls back; integrity and transient errors surface as is
    const bool absent = e.kind() == ErrorKind::NOT_FOUND || e.kind() == ErrorKind::MANIFEST_NOT_FOUND;
    if (!absent || !remote_) {
      throw;
    }
    BOOST_LOG_TRIVIAL(info) << "DDS service: " << manifest_id << " incomplete locally (" << e.what()
                            << "), falling back to remote";
  }
  return retrieve_remote(manifest_id);
}

//==============================================
// REMOTE FALLBACK
//==============================================

Bytes DdsService::retrieve_remote(const ManifestId& manifest_id) {
  RetrievedContent content = remote_->retrieve_verified(manifest_id);
  cache_locally(content);
  return std::move(content.data);
}

void DdsService::cache_locally(const RetrievedContent& content) {
  // Chunks before the manifest, as when publishing
  try {
    for (const auto& chunk : content.chunks) {
      storage_->store_chunk(chunk);
    }
    storage_->store_manifest(content.manifest);
  }
  catch (const Error& e) {
    // The verified content is still returned; the next retrieval goes remote again
    BOOST_LOG_TRIVIAL(warning) << "DDS service: Failed to cache manifest " << content.manifest.id
                               << " locally: " << e.what();
    return;
  }
  BOOST_LOG_TRIVIAL(debug) << "DDS service: Cached manifest " << content.manifest.id << " and "
                           << content.chunks.size() << " chunks locally";
}

} // namespace content
} // namespace dsb
