#ifndef DSB_CONTENT_MANIFEST_HPP
#define DSB_CONTENT_MANIFEST_HPP

#include <cstdint>
#include <vector>
#include "content/chunk.hpp"

namespace dsb {
namespace content {

// ---- MANIFEST CONSTRUCTION ----
// Builds a manifest and derives its id from content_id, chunk_ids and total_size
Manifest make_manifest(const Cid& content_id, const std::vector<Cid>& chunk_ids, uint64_t total_size);
// Hex SHA-256 over the canonical encoding of the manifest body (id excluded)
ManifestId compute_manifest_id(const Manifest& manifest);
// True if the stored id matches the one derived from the body
bool verify_manifest_id(const Manifest& manifest);


// ---- SERIALIZATION AND DESERIALIZATION ----
// Binary record: id, content_id, chunk count, chunk ids, total_size
Bytes encode_manifest(const Manifest& manifest);
// Throws Error(INCONSISTENT_MANIFEST) on truncated or trailing data
Manifest decode_manifest(const Bytes& data);

} // namespace content
} // namespace dsb

#endif // DSB_CONTENT_MANIFEST_HPP
