#ifndef DSB_LEDGER_BLOCK_HPP
#define DSB_LEDGER_BLOCK_HPP

#include <cstdint>
#include <string>
#include <vector>
#include "ledger/transaction.hpp"

namespace dsb {
namespace ledger {

// Well-known prev_hash of the genesis block
extern const std::string GENESIS_PREV_HASH;

// Hashes are lower-case hex SHA-256 strings. hash covers index, timestamp,
// prev_hash and merkle_root; the merkle root commits to every transaction.
struct Block {
  uint64_t index = 0;
  int64_t timestamp = 0;  // nanoseconds since epoch
  std::vector<Transaction> transactions;
  std::string prev_hash;
  std::string merkle_root;
  std::string hash;
};

bool operator==(const Block& lhs, const Block& rhs);
inline bool operator!=(const Block& lhs, const Block& rhs) { return !(lhs == rhs); }


// ---- HASHING ----
// Pairwise SHA-256 tree over transaction hashes; the last node is paired with
// itself on odd levels and an empty list yields the zero hash
std::string compute_merkle_root(const std::vector<Transaction>& transactions);
std::string compute_block_hash(const Block& block);


// ---- CONSTRUCTION ----
// Stamps the current time and fills in merkle_root and hash
Block make_block(uint64_t index, std::vector<Transaction> transactions, const std::string& prev_hash);
// Fixed block: index 0, timestamp 0, no transactions, GENESIS_PREV_HASH
Block genesis_block();

} // namespace ledger
} // namespace dsb

#endif // DSB_LEDGER_BLOCK_HPP
