#ifndef DSB_CONTENT_CHUNK_HPP
#define DSB_CONTENT_CHUNK_HPP

#include <cstdint>
#include <vector>
#include "core/types.hpp"

namespace dsb {
namespace content {

using ManifestId = Cid;

// Content-addressed fragment; id is the hex SHA-256 of data
struct Chunk {
  Cid id;
  Bytes data;
  uint64_t size = 0;
};

// Describes how to reassemble content from its ordered chunk ids.
// id is the manifest's own storage key and is derived from the other fields
// (see make_manifest); content_id is the hash of the full content.
struct Manifest {
  ManifestId id;
  Cid content_id;
  std::vector<Cid> chunk_ids;
  uint64_t total_size = 0;
};

inline bool operator==(const Chunk& lhs, const Chunk& rhs) {
  return lhs.id == rhs.id && lhs.data == rhs.data && lhs.size == rhs.size;
}

inline bool operator==(const Manifest& lhs, const Manifest& rhs) {
  return lhs.id == rhs.id && lhs.content_id == rhs.content_id
      && lhs.chunk_ids == rhs.chunk_ids && lhs.total_size == rhs.total_size;
}

} // namespace content
} // namespace dsb

#endif // DSB_CONTENT_CHUNK_HPP
