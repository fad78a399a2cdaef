#include "identity/wallet.hpp"
#include <utility>
#include <boost/log/trivial.hpp>

namespace dsb {
namespace identity {

Wallet::Wallet(KeyPair keys)
  : keys_(std::move(keys))
  , address_(public_key_to_address(keys_.public_key)) {
}

Wallet Wallet::create() {
  Wallet wallet(generate_keypair());
  BOOST_LOG_TRIVIAL(info) << "Wallet: Created wallet " << wallet.address();
  return wallet;
}

Wallet Wallet::from_private_key(const PrivateKey& private_key) {
  KeyPair keys;
  keys.public_key = derive_public_key(private_key);
  keys.private_key = private_key;
  Wallet wallet(std::move(keys));
  BOOST_LOG_TRIVIAL(info) << "Wallet: Loaded wallet " << wallet.address();
  return wallet;
}

Signature Wallet::sign(const Bytes& message) const {
  return sign_message(keys_.private_key, message);
}

bool Wallet::verify(const Bytes& message, const Signature& signature) const {
  return verify_message(keys_.public_key, message, signature);
}

} // namespace identity
} // namespace dsb
