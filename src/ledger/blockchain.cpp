#include "ledger/blockchain.hpp"
#include <unordered_set>
#include <utility>
#include <boost/log/trivial.hpp>
#include "core/error.hpp"

namespace dsb {
namespace ledger {

//==============================================
// CONSTRUCTION
//==============================================

Blockchain::Blockchain() {
  blocks_.push_back(genesis_block());
  BOOST_LOG_TRIVIAL(info) << "Blockchain: Created chain with genesis block " << blocks_.front().hash;
}

Blockchain::Blockchain(std::vector<Block> blocks) : blocks_(std::move(blocks)) {
}

Blockchain Blockchain::from_blocks(std::vector<Block> blocks) {
  if (blocks.empty()) {
    throw Error(ErrorKind::INVALID_ARGUMENT, "Blockchain: A chain needs at least a genesis block");
  }
  BOOST_LOG_TRIVIAL(debug) << "Blockchain: Loading chain of " << blocks.size() << " blocks";
  return Blockchain(std::move(blocks));
}

//==============================================
// CHAIN OPERATIONS
//==============================================

Block Blockchain::add_block(std::vector<Transaction> transactions) {
  for (const auto& tx : transactions) {
    if (!verify(tx)) {
      BOOST_LOG_TRIVIAL(error) << "Blockchain: Rejecting block with "
                               << (tx.is_signed() ? "invalid signature on " : "unsigned ") << "transaction " << tx.id;
      throw Error(ErrorKind::SIGNATURE_INVALID,
                  "Blockchain: Transaction is unsigned or fails verification", tx.id);
    }
  }

  std::lock_guard<std::mutex> lock(mutex_);
  std::unordered_set<std::string> seen;
  for (const auto& tx : transactions) {
    if (!seen.insert(tx.id).second || contains_transaction_locked(tx.id)) {
      BOOST_LOG_TRIVIAL(error) << "Blockchain: Rejecting block with duplicate transaction " << tx.id;
      throw Error(ErrorKind::INVALID_ARGUMENT, "Blockchain: Transaction is already recorded", tx.id);
    }
  }

  const Block& tip = blocks_.back();
  Block block = make_block(tip.index + 1, std::move(transactions), tip.hash);
  blocks_.push_back(block);

  BOOST_LOG_TRIVIAL(info) << "Blockchain: Appended block " << block.index << " (" << block.transactions.size()
                          << " transactions) " << block.hash;
  return block;
}

bool Blockchain::is_valid() const {
  std::lock_guard<std::mutex> lock(mutex_);
  try {
    validate_locked();
  }
  catch (const Error& e) {
    BOOST_LOG_TRIVIAL(warning) << "Blockchain: Chain is invalid: " << e.what();
    return false;
  }
  return true;
}

void Blockchain::validate() const {
  std::lock_guard<std::mutex> lock(mutex_);
  validate_locked();
}

void Blockchain::validate_locked() const {
  if (blocks_.empty()) {
    throw Error(ErrorKind::CHAIN_LINKAGE_BROKEN, "Blockchain: Chain has no genesis block");
  }

  if (!(blocks_.front() == genesis_block())) {
    throw Error(ErrorKind::CHAIN_LINKAGE_BROKEN, "Blockchain: First block is not the genesis block", "0");
  }

  std::unordered_set<std::string> seen;

  for (size_t i = 0; i < blocks_.size(); ++i) {
    const Block& block = blocks_[i];
    const std::string subject = std::to_string(i);

    if (block.index != i) {
      throw Error(ErrorKind::CHAIN_LINKAGE_BROKEN,
                  "Blockchain: Block at position " + subject + " has index " + std::to_string(block.index), subject);
    }
    if (block.merkle_root != compute_merkle_root(block.transactions)) {
      throw Error(ErrorKind::CHAIN_LINKAGE_BROKEN,
                  "Blockchain: Merkle root of block " + subject + " does not match its transactions", subject);
    }
    if (block.hash != compute_block_hash(block)) {
      throw Error(ErrorKind::CHAIN_LINKAGE_BROKEN, "Blockchain: Stored hash of block " + subject + " is wrong", subject);
    }
    if (i > 0 && block.prev_hash != blocks_[i - 1].hash) {
      throw Error(ErrorKind::CHAIN_LINKAGE_BROKEN,
                  "Blockchain: Block " + subject + " does not link to its predecessor", subject);
    }
    for (const auto& tx : block.transactions) {
      // Odd merkle levels duplicate their last node, so a repeated transaction would not change the root
      if (!seen.insert(tx.id).second) {
        throw Error(ErrorKind::CHAIN_LINKAGE_BROKEN,
                    "Blockchain: Transaction " + tx.id + " in block " + subject + " is recorded twice", subject);
      }
      if (!verify(tx)) {
        throw Error(ErrorKind::SIGNATURE_INVALID,
                    "Blockchain: Transaction " + tx.id + " in block " + subject + " fails verification", subject);
      }
    }
  }
}

//==============================================
// QUERY METHODS
//==============================================

Block Blockchain::latest_block() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return blocks_.back();
}

std::size_t Blockchain::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return blocks_.size();
}

Block Blockchain::block_at(std::size_t index) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (index >= blocks_.size()) {
    throw Error(ErrorKind::NOT_FOUND, "Blockchain: No block at index " + std::to_string(index),
                std::to_string(index));
  }
  return blocks_[index];
}

bool Blockchain::contains_transaction_locked(const std::string& id) const {
  for (const auto& block : blocks_) {
    for (const auto& tx : block.transactions) {
      if (tx.id == id) {
        return true;
      }
    }
  }
  return false;
}

std::optional<Transaction> Blockchain::find_transaction(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& block : blocks_) {
    for (const auto& tx : block.transactions) {
      if (tx.id == id) {
        return tx;
      }
    }
  }
  return std::nullopt;
}

std::vector<Block> Blockchain::blocks() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return blocks_;
}

} // namespace ledger
} // namespace dsb
