#ifndef DSB_LEDGER_BLOCKCHAIN_HPP
#define DSB_LEDGER_BLOCKCHAIN_HPP

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "ledger/block.hpp"

namespace dsb {
namespace ledger {

// Append-only, hash-linked list of blocks starting at the fixed genesis block.
// add_block is serialized so every block is built against a unique tip.
class Blockchain {
public:

  // ---- CONSTRUCTION ----
  // Chain holding only the genesis block
  Blockchain();
  // Adopts externally supplied blocks as they are, without repairing them.
  // Throws Error(INVALID_ARGUMENT) for an empty list
  static Blockchain from_blocks(std::vector<Block> blocks);

  Blockchain(const Blockchain&) = delete;
  Blockchain& operator=(const Blockchain&) = delete;


  // ---- CHAIN OPERATIONS ----
  // Every transaction must be signed and verify; otherwise throws
  // Error(SIGNATURE_INVALID) and leaves the chain unchanged.
  // A transaction id already in the chain or repeated in the list throws
  // Error(INVALID_ARGUMENT)
  Block add_block(std::vector<Transaction> transactions);
  bool is_valid() const;
  // Throws Error(CHAIN_LINKAGE_BROKEN or SIGNATURE_INVALID) for the first violation
  void validate() const;


  // ---- QUERY METHODS ----
  Block latest_block() const;
  std::size_t size() const;
  // Throws Error(NOT_FOUND) when out of range
  Block block_at(std::size_t index) const;
  std::optional<Transaction> find_transaction(const std::string& id) const;
  std::vector<Block> blocks() const;

private:
  explicit Blockchain(std::vector<Block> blocks);

  // ---- PARAMETERS ----
  mutable std::mutex mutex_;
  std::vector<Block> blocks_;

  void validate_locked() const;
  bool contains_transaction_locked(const std::string& id) const;
};

} // namespace ledger
} // namespace dsb

#endif // DSB_LEDGER_BLOCKCHAIN_HPP
