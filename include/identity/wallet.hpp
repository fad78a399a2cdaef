#pragma once

#include <string>
#include "identity/keys.hpp"

namespace dsb {
namespace identity {

// Owns one keypair and the address derived from its public key
class Wallet {
public:

  // ---- FACTORIES ----
  static Wallet create();
  // Throws crypto::KeyError for a malformed private key
  static Wallet from_private_key(const PrivateKey& private_key);


  // ---- SIGNING ----
  Signature sign(const Bytes& message) const;
  bool verify(const Bytes& message, const Signature& signature) const;


  // ---- GETTERS ----
  const std::string& address() const { return address_; }
  const PublicKey& public_key() const { return keys_.public_key; }
  const PrivateKey& private_key() const { return keys_.private_key; }

private:
  explicit Wallet(KeyPair keys);

  // ---- PARAMETERS ----
  KeyPair keys_;
  std::string address_;
};

} // namespace identity
} // namespace dsb
