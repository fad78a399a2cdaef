#pragma once

#include "content/chunk.hpp"
#include "core/error.hpp"

namespace dsb {
namespace store {

// Persistence contract for chunks and manifests. Implementations must tolerate
// concurrent readers and writers. Storing an existing id again is a no-op
// semantically. Lookups of absent ids throw Error(NOT_FOUND); transient backend
// failures throw a retryable Error (UNAVAILABLE or IO).
class Storage {
public:
  virtual ~Storage() = default;

  virtual void store_chunk(const content::Chunk& chunk) = 0;
  virtual content::Chunk get_chunk(const Cid& id) const = 0;
  virtual void store_manifest(const content::Manifest& manifest) = 0;
  virtual content::Manifest get_manifest(const content::ManifestId& id) const = 0;
};

} // namespace store
} // namespace dsb
