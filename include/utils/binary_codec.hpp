#ifndef DSB_UTILS_BINARY_CODEC_HPP
#define DSB_UTILS_BINARY_CODEC_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include "core/types.hpp"

namespace dsb {
namespace utils {

class CodecError : public std::runtime_error {
public:
  explicit CodecError(const std::string& message) : std::runtime_error(message) {}
};

// Appends fixed-width integers in network byte order and length-prefixed
// byte strings. Used wherever a canonical encoding is hashed or persisted.
class BinaryWriter {
public:
  // ---- WRITE OPERATIONS ----
  BinaryWriter& write_u8(uint8_t value);
  BinaryWriter& write_u32(uint32_t value);
  BinaryWriter& write_u64(uint64_t value);
  BinaryWriter& write_i64(int64_t value);
  // Writes a u32 length followed by the raw bytes
  BinaryWriter& write_bytes(const Bytes& data);
  BinaryWriter& write_string(const std::string& data);


  // ---- GETTERS ----
  const Bytes& data() const { return buffer_; }
  Bytes release() { return std::move(buffer_); }

private:
  Bytes buffer_;

  void append(const void* data, std::size_t size);
};

class BinaryReader {
public:
  // ---- CONSTRUCTOR ----
  explicit BinaryReader(const Bytes& data) : data_(data) {}


  // ---- READ OPERATIONS ----
  // All reads throw CodecError when the input is exhausted
  uint8_t read_u8();
  uint32_t read_u32();
  uint64_t read_u64();
  int64_t read_i64();
  Bytes read_bytes();
  std::string read_string();


  // ---- QUERY METHODS ----
  bool at_end() const { return offset_ == data_.size(); }
  std::size_t remaining() const { return data_.size() - offset_; }

private:
  const Bytes& data_;
  std::size_t offset_ = 0;

  void read_raw(void* out, std::size_t size);
};

} // namespace utils
} // namespace dsb

#endif // DSB_UTILS_BINARY_CODEC_HPP
