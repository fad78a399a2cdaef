#include "identity/keys.hpp"
#include <openssl/err.h>
#include <openssl/evp.h>
#include <string>
#include <boost/log/trivial.hpp>
#include "crypto/hash.hpp"

namespace dsb {
namespace identity {

namespace {

//=================================================
// RAII WRAPPERS FOR OPENSSL KEY OBJECTS
//=================================================

struct KeyHandle {
  EVP_PKEY* key = nullptr;

  KeyHandle() = default;
  explicit KeyHandle(EVP_PKEY* k) : key(k) {}
  ~KeyHandle() {
    if (key) {
      EVP_PKEY_free(key);
    }
  }

  KeyHandle(const KeyHandle&) = delete;
  KeyHandle& operator=(const KeyHandle&) = delete;

  EVP_PKEY* get() { return key; }
};

struct KeyContext {
  EVP_PKEY_CTX* ctx = nullptr;

  KeyContext() {
    ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr);
    if (!ctx) {
      throw crypto::KeyError("Failed to create key context");
    }
  }

  ~KeyContext() {
    if (ctx) {
      EVP_PKEY_CTX_free(ctx);
    }
  }

  KeyContext(const KeyContext&) = delete;
  KeyContext& operator=(const KeyContext&) = delete;

  EVP_PKEY_CTX* get() { return ctx; }
};

struct SignContext {
  EVP_MD_CTX* ctx = nullptr;

  SignContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw crypto::SigningError("Failed to create signing context");
    }
  }

  ~SignContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  SignContext(const SignContext&) = delete;
  SignContext& operator=(const SignContext&) = delete;

  EVP_MD_CTX* get() { return ctx; }
};

// Most recent OpenSSL error as text, clearing the error queue
std::string last_openssl_error() {
  unsigned long code = ERR_get_error();
  ERR_clear_error();
  if (code == 0) {
    return "unknown OpenSSL error";
  }
  char buffer[256];
  ERR_error_string_n(code, buffer, sizeof(buffer));
  return buffer;
}

// Ed25519 signs the message itself; OpenSSL wants a valid pointer even for empty input
const unsigned char* message_ptr(const Bytes& message) {
  static const unsigned char empty = 0;
  return message.empty() ? &empty : message.data();
}

void load_private_key(const PrivateKey& private_key, KeyHandle& handle) {
  if (private_key.size() != PRIVATE_KEY_SIZE) {
    throw crypto::KeyError("Private key must be " + std::to_string(PRIVATE_KEY_SIZE) + " bytes, got " +
                           std::to_string(private_key.size()));
  }
  handle.key = EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, private_key.data(), private_key.size());
  if (!handle.key) {
    throw crypto::KeyError("Failed to load private key: " + last_openssl_error());
  }
}

PublicKey raw_public_key(EVP_PKEY* key) {
  PublicKey public_key(PUBLIC_KEY_SIZE);
  size_t length = public_key.size();
  if (EVP_PKEY_get_raw_public_key(key, public_key.data(), &length) != 1 || length != PUBLIC_KEY_SIZE) {
    throw crypto::KeyError("Failed to export public key: " + last_openssl_error());
  }
  return public_key;
}

} // namespace

//==============================================
// KEY MANAGEMENT
//==============================================

KeyPair generate_keypair() {
  KeyContext context;
  if (EVP_PKEY_keygen_init(context.get()) != 1) {
    throw crypto::KeyError("Failed to initialize key generation: " + last_openssl_error());
  }

  KeyHandle key;
  if (EVP_PKEY_keygen(context.get(), &key.key) != 1) {
    throw crypto::KeyError("Failed to generate keypair: " + last_openssl_error());
  }

  KeyPair pair;
  pair.private_key.resize(PRIVATE_KEY_SIZE);
  size_t length = pair.private_key.size();
  if (EVP_PKEY_get_raw_private_key(key.get(), pair.private_key.data(), &length) != 1 ||
      length != PRIVATE_KEY_SIZE) {
    throw crypto::KeyError("Failed to export private key: " + last_openssl_error());
  }
  pair.public_key = raw_public_key(key.get());

  BOOST_LOG_TRIVIAL(debug) << "Identity: Generated keypair for " << public_key_to_address(pair.public_key);
  return pair;
}

PublicKey derive_public_key(const PrivateKey& private_key) {
  KeyHandle key;
  load_private_key(private_key, key);
  return raw_public_key(key.get());
}

std::string public_key_to_address(const PublicKey& public_key) {
  return crypto::sha256_hex(public_key);
}

//==============================================
// SIGNING AND VERIFICATION
//==============================================

Signature sign_message(const PrivateKey& private_key, const Bytes& message) {
  KeyHandle key;
  load_private_key(private_key, key);

  SignContext context;
  if (EVP_DigestSignInit(context.get(), nullptr, nullptr, nullptr, key.get()) != 1) {
    throw crypto::SigningError("Failed to initialize signing: " + last_openssl_error());
  }

  Signature signature(SIGNATURE_SIZE);
  size_t length = signature.size();
  if (EVP_DigestSign(context.get(), signature.data(), &length, message_ptr(message), message.size()) != 1) {
    throw crypto::SigningError("Failed to sign message: " + last_openssl_error());
  }
  signature.resize(length);
  return signature;
}

bool verify_message(const PublicKey& public_key, const Bytes& message, const Signature& signature) {
  if (public_key.size() != PUBLIC_KEY_SIZE || signature.size() != SIGNATURE_SIZE) {
    BOOST_LOG_TRIVIAL(debug) << "Identity: Rejecting malformed key or signature (" << public_key.size()
                             << "/" << signature.size() << " bytes)";
    return false;
  }

  KeyHandle key(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, public_key.data(), public_key.size()));
  if (!key.get()) {
    BOOST_LOG_TRIVIAL(debug) << "Identity: Rejecting unusable public key: " << last_openssl_error();
    return false;
  }

  SignContext context;
  if (EVP_DigestVerifyInit(context.get(), nullptr, nullptr, nullptr, key.get()) != 1) {
    BOOST_LOG_TRIVIAL(warning) << "Identity: Failed to initialize verification: " << last_openssl_error();
    return false;
  }

  int result = EVP_DigestVerify(context.get(), signature.data(), signature.size(),
                                message_ptr(message), message.size());
  if (result != 1) {
    ERR_clear_error();
    return false;
  }
  return true;
}

} // namespace identity
} // namespace dsb
