#include "crypto/hash.hpp"
#include <openssl/evp.h>
#include <iomanip>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace dsb::crypto {

//=================================================
// RAII WRAPPER TO MANAGE DIGEST CONTEXT LIFECYCLE
//=================================================

struct Sha256::DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw DigestError("Failed to create hash context");
    }
  }

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  EVP_MD_CTX* get() { return ctx; }
};

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Sha256::Sha256() : context_(std::make_unique<DigestContext>()) {
  // Initialize the context with SHA-256 algorithm
  if (!EVP_DigestInit_ex(context_->get(), EVP_sha256(), nullptr)) {
    throw DigestError("Failed to initialize hash context");
  }
}

Sha256::~Sha256() = default;

//==============================================
// DIGEST OPERATIONS
//==============================================

Sha256& Sha256::update(const uint8_t* data, size_t size) {
  if (finished_) {
    throw DigestError("Hash context already finalized");
  }
  if (size == 0) {
    return *this;
  }
  if (!EVP_DigestUpdate(context_->get(), data, size)) {
    throw DigestError("Failed to update hash");
  }
  return *this;
}

Sha256& Sha256::update(const std::string& data) {
  return update(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

ContentHash Sha256::finish() {
  if (finished_) {
    throw DigestError("Hash context already finalized");
  }

  ContentHash digest{};
  unsigned int digest_len = 0;
  if (!EVP_DigestFinal_ex(context_->get(), digest.data(), &digest_len)) {
    throw DigestError("Failed to finalize hash");
  }
  finished_ = true;

  if (digest_len != HASH_SIZE) {
    throw DigestError("Unexpected digest length: " + std::to_string(digest_len));
  }
  return digest;
}

//==============================================
// ONE-SHOT HELPERS
//==============================================

ContentHash sha256(const uint8_t* data, size_t size) {
  Sha256 hasher;
  hasher.update(data, size);
  return hasher.finish();
}

ContentHash sha256(const Bytes& data) {
  return sha256(data.data(), data.size());
}

Cid sha256_hex(const Bytes& data) {
  return to_hex(sha256(data));
}

Cid sha256_hex(const std::string& data) {
  return to_hex(sha256(reinterpret_cast<const uint8_t*>(data.data()), data.size()));
}

//==============================================
// HEX CONVERSION
//==============================================

std::string to_hex(const uint8_t* data, size_t size) {
  // Convert the raw bytes to a hexadecimal string
  std::stringstream ss;
  for (size_t i = 0; i < size; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(data[i]);
  }
  return ss.str();
}

std::string to_hex(const ContentHash& hash) {
  return to_hex(hash.data(), hash.size());
}

std::string to_hex(const Bytes& data) {
  return to_hex(data.data(), data.size());
}

namespace {

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

Bytes from_hex(const std::string& hex) {
  if (hex.size() % 2 != 0) {
    BOOST_LOG_TRIVIAL(debug) << "Hash: Odd length hex string of size " << hex.size();
    throw CryptoError("Invalid hex string length");
  }

  Bytes out;
  out.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    int high = hex_value(hex[i]);
    int low = hex_value(hex[i + 1]);
    if (high < 0 || low < 0) {
      throw CryptoError("Invalid hex character in string");
    }
    out.push_back(static_cast<uint8_t>((high << 4) | low));
  }
  return out;
}

bool is_cid(const std::string& text) {
  if (text.size() != HASH_SIZE * 2) {
    return false;
  }
  for (char c : text) {
    if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
      return false;
    }
  }
  return true;
}

} // namespace dsb::crypto
