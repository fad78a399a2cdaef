#pragma once

#include <memory>
#include "content/chunk.hpp"
#include "store/storage.hpp"

namespace dsb {
namespace content {

// Fetch boundary consumed by ContentRetriever. A network or distributed
// backend plugs in here; implementations must be safe to call from several
// threads at once.
class Retriever {
public:
  virtual ~Retriever() = default;

  virtual Manifest fetch_manifest(const ManifestId& id) = 0;
  virtual Chunk fetch_chunk(const Cid& id) = 0;
};

// Serves fetches from a Storage backend. Absent manifests surface as
// MANIFEST_NOT_FOUND, absent chunks as NOT_FOUND.
class StorageRetriever : public Retriever {
public:
  explicit StorageRetriever(std::shared_ptr<const store::Storage> storage);

  Manifest fetch_manifest(const ManifestId& id) override;
  Chunk fetch_chunk(const Cid& id) override;

private:
  std::shared_ptr<const store::Storage> storage_;
};

} // namespace content
} // namespace dsb
