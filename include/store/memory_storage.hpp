#pragma once

#include <cstddef>
#include <shared_mutex>
#include <unordered_map>
#include "store/storage.hpp"

namespace dsb {
namespace store {

// Owned in-memory backend: two maps behind one reader/writer lock
class InMemoryStorage : public Storage {
public:

  // ---- CORE STORAGE OPERATIONS ----
  void store_chunk(const content::Chunk& chunk) override;
  content::Chunk get_chunk(const Cid& id) const override;
  void store_manifest(const content::Manifest& manifest) override;
  content::Manifest get_manifest(const content::ManifestId& id) const override;


  // ---- QUERY OPERATIONS ----
  bool has_chunk(const Cid& id) const;
  bool has_manifest(const content::ManifestId& id) const;
  std::size_t chunk_count() const;
  std::size_t manifest_count() const;

private:
  // ---- PARAMETERS ----
  mutable std::shared_mutex mutex_;
  std::unordered_map<Cid, content::Chunk> chunks_;
  std::unordered_map<content::ManifestId, content::Manifest> manifests_;
};

} // namespace store
} // namespace dsb
