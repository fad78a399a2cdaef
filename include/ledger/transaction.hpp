#ifndef DSB_LEDGER_TRANSACTION_HPP
#define DSB_LEDGER_TRANSACTION_HPP

#include <cstdint>
#include <optional>
#include <string>
#include "content/chunk.hpp"
#include "crypto/hash.hpp"
#include "identity/keys.hpp"

namespace dsb {
namespace ledger {

enum class TransactionType {
  GENERIC = 0,
  POST_CREATED,
  FOLLOW_USER
};

const char* transaction_type_to_string(TransactionType type);
std::optional<TransactionType> transaction_type_from_string(const std::string& text);

// Signed unit of ledger data. Created unsigned, signed exactly once, then only
// read. The signature covers id, timestamp, type, sender_public_key and payload.
struct Transaction {
  std::string id;
  int64_t timestamp = 0;  // nanoseconds since epoch
  TransactionType type = TransactionType::GENERIC;
  identity::PublicKey sender_public_key;
  Bytes payload;
  identity::Signature signature;

  bool is_signed() const { return !signature.empty(); }
};

bool operator==(const Transaction& lhs, const Transaction& rhs);
inline bool operator!=(const Transaction& lhs, const Transaction& rhs) { return !(lhs == rhs); }


// ---- CONSTRUCTION ----
// Unsigned transaction with a fresh random UUID and the current time
Transaction new_transaction(const identity::PublicKey& sender_public_key, TransactionType type, Bytes payload);


// ---- SIGNING AND VERIFICATION ----
// Bytes the signature is computed over
Bytes signing_bytes(const Transaction& tx);
// Throws Error(INVALID_ARGUMENT) if private_key does not belong to the sender,
// Error(SIGNATURE_INVALID) if tx already carries a signature
void sign(Transaction& tx, const identity::PrivateKey& private_key);
// False for unsigned transactions and any post-signing mutation
bool verify(const Transaction& tx);
// Hash over the signed form, used as a merkle leaf
crypto::ContentHash transaction_hash(const Transaction& tx);


// ---- CONTENT REFERENCES ----
// PostCreated transaction whose payload is the UTF-8 manifest id
Transaction content_reference_transaction(const identity::PublicKey& sender_public_key,
                                          const content::ManifestId& manifest_id);
// Throws Error(INVALID_ARGUMENT) if the payload is not a manifest id
content::ManifestId manifest_id_from_payload(const Transaction& tx);

} // namespace ledger
} // namespace dsb

#endif // DSB_LEDGER_TRANSACTION_HPP
