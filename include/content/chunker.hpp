#pragma once

#include <cstddef>
#include <vector>
#include "content/chunk.hpp"

namespace dsb {
namespace content {

// Fixed-size chunking. The same bytes with the same chunk size always yield the
// same boundaries and ids; the last chunk carries the remainder.
class Chunker {
public:
  static constexpr std::size_t DEFAULT_CHUNK_SIZE = 1024;

  // ---- CONSTRUCTOR ----
  // A chunk size of 0 falls back to DEFAULT_CHUNK_SIZE
  explicit Chunker(std::size_t chunk_size = DEFAULT_CHUNK_SIZE);


  // ---- CHUNKING ----
  // Empty input yields an empty list
  std::vector<Chunk> chunk(const Bytes& data) const;


  // ---- GETTERS ----
  std::size_t chunk_size() const { return chunk_size_; }

private:
  std::size_t chunk_size_;
};

// Builds a chunk from raw data, computing its id
Chunk make_chunk(Bytes data);

// True if the chunk's id matches the hash of its data
bool verify_chunk(const Chunk& chunk);

} // namespace content
} // namespace dsb
