#include "content/manifest.hpp"
#include <limits>
#include <boost/log/trivial.hpp>
#include "core/error.hpp"
#include "crypto/hash.hpp"
#include "utils/binary_codec.hpp"

namespace dsb {
namespace content {

//==============================================
// MANIFEST CONSTRUCTION
//==============================================

Manifest make_manifest(const Cid& content_id, const std::vector<Cid>& chunk_ids, uint64_t total_size) {
  Manifest manifest;
  manifest.content_id = content_id;
  manifest.chunk_ids = chunk_ids;
  manifest.total_size = total_size;
  manifest.id = compute_manifest_id(manifest);
  return manifest;
}

ManifestId compute_manifest_id(const Manifest& manifest) {
  utils::BinaryWriter writer;
  writer.write_string(manifest.content_id);
  writer.write_u32(static_cast<uint32_t>(manifest.chunk_ids.size()));
  for (const auto& chunk_id : manifest.chunk_ids) {
    writer.write_string(chunk_id);
  }
  writer.write_u64(manifest.total_size);
  return crypto::sha256_hex(writer.data());
}

bool verify_manifest_id(const Manifest& manifest) {
  return manifest.id == compute_manifest_id(manifest);
}

//==============================================
// SERIALIZATION AND DESERIALIZATION
//==============================================

Bytes encode_manifest(const Manifest& manifest) {
  if (manifest.chunk_ids.size() > std::numeric_limits<uint32_t>::max()) {
    throw Error(ErrorKind::INVALID_ARGUMENT, "Manifest: Too many chunks to encode", manifest.id);
  }

  utils::BinaryWriter writer;
  writer.write_string(manifest.id);
  writer.write_string(manifest.content_id);
  writer.write_u32(static_cast<uint32_t>(manifest.chunk_ids.size()));
  for (const auto& chunk_id : manifest.chunk_ids) {
    writer.write_string(chunk_id);
  }
  writer.write_u64(manifest.total_size);
  return writer.release();
}

Manifest decode_manifest(const Bytes& data) {
  try {
    utils::BinaryReader reader(data);
    Manifest manifest;
    manifest.id = reader.read_string();
    manifest.content_id = reader.read_string();

    uint32_t chunk_count = reader.read_u32();
    // Each id needs at least its length prefix
    if (static_cast<uint64_t>(chunk_count) * sizeof(uint32_t) > reader.remaining()) {
      throw utils::CodecError("Codec: Chunk count exceeds input");
    }
    manifest.chunk_ids.reserve(chunk_count);
    for (uint32_t i = 0; i < chunk_count; ++i) {
      manifest.chunk_ids.push_back(reader.read_string());
    }
    manifest.total_size = reader.read_u64();

    if (!reader.at_end()) {
      throw utils::CodecError("Codec: Trailing bytes after manifest record");
    }
    return manifest;
  }
  catch (const utils::CodecError&) {
    BOOST_LOG_TRIVIAL(error) << "Manifest: Failed to decode manifest record of " << data.size() << " bytes";
    throw Error::wrap_current(ErrorKind::INCONSISTENT_MANIFEST, "Manifest: Malformed manifest record");
  }
}

} // namespace content
} // namespace dsb
