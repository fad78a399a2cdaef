#ifndef DSB_IDENTITY_KEYS_HPP
#define DSB_IDENTITY_KEYS_HPP

#include <cstddef>
#include <string>
#include "core/types.hpp"
#include "crypto/crypto_error.hpp"

namespace dsb {
namespace identity {

// Ed25519 keys and signatures in raw form
using PrivateKey = Bytes;
using PublicKey = Bytes;
using Signature = Bytes;

static constexpr size_t PRIVATE_KEY_SIZE = 32;
static constexpr size_t PUBLIC_KEY_SIZE = 32;
static constexpr size_t SIGNATURE_SIZE = 64;

struct KeyPair {
  PrivateKey private_key;
  PublicKey public_key;
};

// ---- KEY MANAGEMENT ----
// Fresh keypair from the OpenSSL random source. Throws crypto::KeyError
KeyPair generate_keypair();
// Throws crypto::KeyError if the private key is not a valid raw Ed25519 key
PublicKey derive_public_key(const PrivateKey& private_key);
// Hex SHA-256 of the raw public key
std::string public_key_to_address(const PublicKey& public_key);


// ---- SIGNING AND VERIFICATION ----
// Throws crypto::KeyError for a malformed key, crypto::SigningError otherwise
Signature sign_message(const PrivateKey& private_key, const Bytes& message);
// False for a bad signature and for malformed keys or signatures
bool verify_message(const PublicKey& public_key, const Bytes& message, const Signature& signature);

} // namespace identity
} // namespace dsb

#endif // DSB_IDENTITY_KEYS_HPP
