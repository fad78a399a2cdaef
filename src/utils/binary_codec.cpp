#include "utils/binary_codec.hpp"
#include <cstring>
#include <limits>
#include <boost/endian/conversion.hpp>
#include <boost/log/trivial.hpp>

namespace dsb {
namespace utils {

//==============================================
// BINARY WRITER
//==============================================

BinaryWriter& BinaryWriter::write_u8(uint8_t value) {
  append(&value, sizeof(value));
  return *this;
}

BinaryWriter& BinaryWriter::write_u32(uint32_t value) {
  uint32_t network_value = boost::endian::native_to_big(value);
  append(&network_value, sizeof(network_value));
  return *this;
}

BinaryWriter& BinaryWriter::write_u64(uint64_t value) {
  uint64_t network_value = boost::endian::native_to_big(value);
  append(&network_value, sizeof(network_value));
  return *this;
}

BinaryWriter& BinaryWriter::write_i64(int64_t value) {
  return write_u64(static_cast<uint64_t>(value));
}

BinaryWriter& BinaryWriter::write_bytes(const Bytes& data) {
  if (data.size() > std::numeric_limits<uint32_t>::max()) {
    throw CodecError("Codec: Field too large to encode: " + std::to_string(data.size()) + " bytes");
  }
  write_u32(static_cast<uint32_t>(data.size()));
  append(data.data(), data.size());
  return *this;
}

BinaryWriter& BinaryWriter::write_string(const std::string& data) {
  return write_bytes(Bytes(data.begin(), data.end()));
}

void BinaryWriter::append(const void* data, std::size_t size) {
  if (size == 0) {
    return;
  }
  const auto* bytes = static_cast<const uint8_t*>(data);
  buffer_.insert(buffer_.end(), bytes, bytes + size);
}

//==============================================
// BINARY READER
//==============================================

uint8_t BinaryReader::read_u8() {
  uint8_t value;
  read_raw(&value, sizeof(value));
  return value;
}

uint32_t BinaryReader::read_u32() {
  uint32_t network_value;
  read_raw(&network_value, sizeof(network_value));
  return boost::endian::big_to_native(network_value);
}

uint64_t BinaryReader::read_u64() {
  uint64_t network_value;
  read_raw(&network_value, sizeof(network_value));
  return boost::endian::big_to_native(network_value);
}

int64_t BinaryReader::read_i64() {
  return static_cast<int64_t>(read_u64());
}

Bytes BinaryReader::read_bytes() {
  uint32_t length = read_u32();
  if (length > remaining()) {
    BOOST_LOG_TRIVIAL(debug) << "Codec: Declared field length " << length
                             << " exceeds remaining " << remaining() << " bytes";
    throw CodecError("Codec: Field length exceeds input");
  }
  Bytes out(data_.begin() + offset_, data_.begin() + offset_ + length);
  offset_ += length;
  return out;
}

std::string BinaryReader::read_string() {
  Bytes raw = read_bytes();
  return std::string(raw.begin(), raw.end());
}

void BinaryReader::read_raw(void* out, std::size_t size) {
  if (size > remaining()) {
    throw CodecError("Codec: Unexpected end of input");
  }
  std::memcpy(out, data_.data() + offset_, size);
  offset_ += size;
}

} // namespace utils
} // namespace dsb
