#include "content/chunker.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>
#include "crypto/hash.hpp"

namespace dsb {
namespace content {

Chunker::Chunker(std::size_t chunk_size) : chunk_size_(chunk_size) {
  if (chunk_size_ == 0) {
    BOOST_LOG_TRIVIAL(warning) << "Chunker: Invalid chunk size 0, using default of "
                               << DEFAULT_CHUNK_SIZE << " bytes";
    chunk_size_ = DEFAULT_CHUNK_SIZE;
  }
}

std::vector<Chunk> Chunker::chunk(const Bytes& data) const {
  std::vector<Chunk> chunks;
  if (data.empty()) {
    BOOST_LOG_TRIVIAL(debug) << "Chunker: Empty input, no chunks produced";
    return chunks;
  }

  chunks.reserve((data.size() + chunk_size_ - 1) / chunk_size_);
  for (std::size_t offset = 0; offset < data.size(); offset += chunk_size_) {
    std::size_t end = std::min(offset + chunk_size_, data.size());
    chunks.push_back(make_chunk(Bytes(data.begin() + offset, data.begin() + end)));
  }

  BOOST_LOG_TRIVIAL(debug) << "Chunker: Split " << data.size() << " bytes into "
                           << chunks.size() << " chunks of up to " << chunk_size_ << " bytes";
  return chunks;
}

Chunk make_chunk(Bytes data) {
  Chunk chunk;
  chunk.id = crypto::sha256_hex(data);
  chunk.size = data.size();
  chunk.data = std::move(data);
  return chunk;
}

bool verify_chunk(const Chunk& chunk) {
  return chunk.size == chunk.data.size() && crypto::sha256_hex(chunk.data) == chunk.id;
}

} // namespace content
} // namespace dsb
