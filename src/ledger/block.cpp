#include "ledger/block.hpp"
#include <chrono>
#include <utility>
#include "crypto/hash.hpp"
#include "utils/binary_codec.hpp"

namespace dsb {
namespace ledger {

const std::string GENESIS_PREV_HASH(crypto::HASH_SIZE * 2, '0');

bool operator==(const Block& lhs, const Block& rhs) {
  return lhs.index == rhs.index &&
         lhs.timestamp == rhs.timestamp &&
         lhs.transactions == rhs.transactions &&
         lhs.prev_hash == rhs.prev_hash &&
         lhs.merkle_root == rhs.merkle_root &&
         lhs.hash == rhs.hash;
}

//==============================================
// HASHING
//==============================================

std::string compute_merkle_root(const std::vector<Transaction>& transactions) {
  if (transactions.empty()) {
    return crypto::to_hex(crypto::ContentHash{});
  }

  std::vector<crypto::ContentHash> level;
  level.reserve(transactions.size());
  for (const auto& tx : transactions) {
    level.push_back(transaction_hash(tx));
  }

  while (level.size() > 1) {
    if (level.size() % 2 != 0) {
      level.push_back(level.back());
    }
    std::vector<crypto::ContentHash> next;
    next.reserve(level.size() / 2);
    for (size_t i = 0; i < level.size(); i += 2) {
      crypto::Sha256 digest;
      digest.update(level[i].data(), level[i].size());
      digest.update(level[i + 1].data(), level[i + 1].size());
      next.push_back(digest.finish());
    }
    level = std::move(next);
  }
  return crypto::to_hex(level.front());
}

std::string compute_block_hash(const Block& block) {
  utils::BinaryWriter writer;
  writer.write_u64(block.index)
        .write_i64(block.timestamp)
        .write_string(block.prev_hash)
        .write_string(block.merkle_root);
  return crypto::sha256_hex(writer.data());
}

//==============================================
// CONSTRUCTION
//==============================================

Block make_block(uint64_t index, std::vector<Transaction> transactions, const std::string& prev_hash) {
  Block block;
  block.index = index;
  block.timestamp = std::chrono::duration_cast<std::chrono::nanoseconds>(
      std::chrono::system_clock::now().time_since_epoch()).count();
  block.transactions = std::move(transactions);
  block.prev_hash = prev_hash;
  block.merkle_root = compute_merkle_root(block.transactions);
  block.hash = compute_block_hash(block);
  return block;
}

Block genesis_block() {
  Block block;
  block.prev_hash = GENESIS_PREV_HASH;
  block.merkle_root = compute_merkle_root(block.transactions);
  block.hash = compute_block_hash(block);
  return block;
}

} // namespace ledger
} // namespace dsb
