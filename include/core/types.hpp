#ifndef DSB_CORE_TYPES_HPP
#define DSB_CORE_TYPES_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace dsb {

// Raw byte sequence used for content, chunk data, keys and signatures
using Bytes = std::vector<uint8_t>;

// Content identifier: lower-case hex SHA-256 digest
using Cid = std::string;

inline Bytes to_bytes(const std::string& text) {
  return Bytes(text.begin(), text.end());
}

inline std::string to_string(const Bytes& bytes) {
  return std::string(bytes.begin(), bytes.end());
}

} // namespace dsb

#endif // DSB_CORE_TYPES_HPP
