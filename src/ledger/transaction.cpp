#include "ledger/transaction.hpp"
#include <chrono>
#include <utility>
#include <boost/log/trivial.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include "core/error.hpp"
#include "utils/binary_codec.hpp"

namespace dsb {
namespace ledger {

//==============================================
// TRANSACTION TYPES
//==============================================

const char* transaction_type_to_string(TransactionType type) {
  switch (type) {
    case TransactionType::GENERIC: return "GENERIC";
    case TransactionType::POST_CREATED: return "POST_CREATED";
    case TransactionType::FOLLOW_USER: return "FOLLOW_USER";
    default: return "UNKNOWN";
  }
}

std::optional<TransactionType> transaction_type_from_string(const std::string& text) {
  if (text == "GENERIC") return TransactionType::GENERIC;
  if (text == "POST_CREATED") return TransactionType::POST_CREATED;
  if (text == "FOLLOW_USER") return TransactionType::FOLLOW_USER;
  return std::nullopt;
}

bool operator==(const Transaction& lhs, const Transaction& rhs) {
  return lhs.id == rhs.id &&
         lhs.timestamp == rhs.timestamp &&
         lhs.type == rhs.type &&
         lhs.sender_public_key == rhs.sender_public_key &&
         lhs.payload == rhs.payload &&
         lhs.signature == rhs.signature;
}

//==============================================
// CONSTRUCTION
//==============================================

Transaction new_transaction(const identity::PublicKey& sender_public_key, TransactionType type, Bytes payload) {
  // random_generator is not thread safe; one per thread
  thread_local boost::uuids::random_generator generator;

  Transaction tx;
  tx.id = boost::uuids::to_string(generator());
  tx.timestamp = std::chrono::duration_cast<std::chrono::nanoseconds>(
      std::chrono::system_clock::now().time_since_epoch()).count();
  tx.type = type;
  tx.sender_public_key = sender_public_key;
  tx.payload = std::move(payload);

  BOOST_LOG_TRIVIAL(debug) << "Transaction: Created " << transaction_type_to_string(type) << " transaction " << tx.id;
  return tx;
}

//==============================================
// SIGNING AND VERIFICATION
//==============================================

Bytes signing_bytes(const Transaction& tx) {
  utils::BinaryWriter writer;
  writer.write_string(tx.id)
        .write_i64(tx.timestamp)
        .write_string(transaction_type_to_string(tx.type))
        .write_bytes(tx.sender_public_key)
        .write_bytes(tx.payload);
  return writer.release();
}

void sign(Transaction& tx, const identity::PrivateKey& private_key) {
  if (tx.is_signed()) {
    BOOST_LOG_TRIVIAL(error) << "Transaction: Refusing to re-sign " << tx.id;
    throw Error(ErrorKind::SIGNATURE_INVALID, "Transaction: Already signed", tx.id);
  }

  identity::PublicKey derived;
  try {
    derived = identity::derive_public_key(private_key);
  }
  catch (const crypto::KeyError&) {
    throw Error::wrap_current(ErrorKind::INVALID_ARGUMENT, "Transaction: Unusable private key", tx.id);
  }
  if (derived != tx.sender_public_key) {
    BOOST_LOG_TRIVIAL(error) << "Transaction: Private key does not belong to the sender of " << tx.id;
    throw Error(ErrorKind::INVALID_ARGUMENT, "Transaction: Private key does not match sender public key", tx.id);
  }

  tx.signature = identity::sign_message(private_key, signing_bytes(tx));
  BOOST_LOG_TRIVIAL(debug) << "Transaction: Signed " << tx.id;
}

bool verify(const Transaction& tx) {
  if (!tx.is_signed()) {
    return false;
  }
  return identity::verify_message(tx.sender_public_key, signing_bytes(tx), tx.signature);
}

crypto::ContentHash transaction_hash(const Transaction& tx) {
  utils::BinaryWriter writer;
  writer.write_bytes(signing_bytes(tx)).write_bytes(tx.signature);
  return crypto::sha256(writer.data());
}

//==============================================
// CONTENT REFERENCES
//==============================================

Transaction content_reference_transaction(const identity::PublicKey& sender_public_key,
                                          const content::ManifestId& manifest_id) {
  if (!crypto::is_cid(manifest_id)) {
    throw Error(ErrorKind::INVALID_ARGUMENT, "Transaction: Not a manifest id", manifest_id);
  }
  return new_transaction(sender_public_key, TransactionType::POST_CREATED, dsb::to_bytes(manifest_id));
}

content::ManifestId manifest_id_from_payload(const Transaction& tx) {
  content::ManifestId manifest_id = dsb::to_string(tx.payload);
  if (!crypto::is_cid(manifest_id)) {
    throw Error(ErrorKind::INVALID_ARGUMENT, "Transaction: Payload is not a manifest id", tx.id);
  }
  return manifest_id;
}

} // namespace ledger
} // namespace dsb
