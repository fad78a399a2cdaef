#include "store/memory_storage.hpp"
#include <mutex>
#include <boost/log/trivial.hpp>

namespace dsb {
namespace store {

//==============================================
// CORE STORAGE OPERATIONS
//==============================================

void InMemoryStorage::store_chunk(const content::Chunk& chunk) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  chunks_[chunk.id] = chunk;
  BOOST_LOG_TRIVIAL(trace) << "Memory storage: Stored chunk " << chunk.id << " (" << chunk.size << " bytes)";
}

content::Chunk InMemoryStorage::get_chunk(const Cid& id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = chunks_.find(id);
  if (it == chunks_.end()) {
    BOOST_LOG_TRIVIAL(debug) << "Memory storage: Chunk not found: " << id;
    throw Error(ErrorKind::NOT_FOUND, "Memory storage: Chunk " + id + " not found", id);
  }
  return it->second;
}

void InMemoryStorage::store_manifest(const content::Manifest& manifest) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  manifests_[manifest.id] = manifest;
  BOOST_LOG_TRIVIAL(trace) << "Memory storage: Stored manifest " << manifest.id;
}

content::Manifest InMemoryStorage::get_manifest(const content::ManifestId& id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = manifests_.find(id);
  if (it == manifests_.end()) {
    BOOST_LOG_TRIVIAL(debug) << "Memory storage: Manifest not found: " << id;
    throw Error(ErrorKind::NOT_FOUND, "Memory storage: Manifest " + id + " not found", id);
  }
  return it->second;
}

//==============================================
// QUERY OPERATIONS
//==============================================

bool InMemoryStorage::has_chunk(const Cid& id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return chunks_.count(id) > 0;
}

bool InMemoryStorage::has_manifest(const content::ManifestId& id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return manifests_.count(id) > 0;
}

std::size_t InMemoryStorage::chunk_count() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return chunks_.size();
}

std::size_t InMemoryStorage::manifest_count() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return manifests_.size();
}

} // namespace store
} // namespace dsb
