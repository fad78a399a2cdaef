#ifndef DSB_CRYPTO_HASH_HPP
#define DSB_CRYPTO_HASH_HPP

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include "core/types.hpp"
#include "crypto_error.hpp"

namespace dsb::crypto {

static constexpr size_t HASH_SIZE = 32;   // SHA-256 digest length

using ContentHash = std::array<uint8_t, HASH_SIZE>;

// Incremental SHA-256 over OpenSSL EVP, for hashing data fed in pieces
class Sha256 {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Sha256();
  ~Sha256();

  Sha256(const Sha256&) = delete;
  Sha256& operator=(const Sha256&) = delete;


  // ---- DIGEST OPERATIONS ----
  Sha256& update(const uint8_t* data, size_t size);
  Sha256& update(const Bytes& data) { return update(data.data(), data.size()); }
  Sha256& update(const std::string& data);
  // Produces the digest; the object cannot be updated afterwards
  ContentHash finish();

private:
  struct DigestContext;
  std::unique_ptr<DigestContext> context_;
  bool finished_ = false;
};

// ---- ONE-SHOT HELPERS ----
ContentHash sha256(const uint8_t* data, size_t size);
ContentHash sha256(const Bytes& data);
// Hex encoded digest used as content identifier
Cid sha256_hex(const Bytes& data);
Cid sha256_hex(const std::string& data);


// ---- HEX CONVERSION ----
std::string to_hex(const uint8_t* data, size_t size);
std::string to_hex(const ContentHash& hash);
std::string to_hex(const Bytes& data);
// Throws CryptoError on odd length or non-hex characters
Bytes from_hex(const std::string& hex);
// True for a 64 character lower-case hex string
bool is_cid(const std::string& text);

} // namespace dsb::crypto

#endif // DSB_CRYPTO_HASH_HPP
