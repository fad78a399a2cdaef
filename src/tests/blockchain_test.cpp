#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>
#include "core/error.hpp"
#include "crypto/hash.hpp"
#include "identity/wallet.hpp"
#include "ledger/blockchain.hpp"

using namespace dsb;
using namespace dsb::ledger;

class BlockchainTest : public ::testing::Test {
protected:
  identity::Wallet wallet = identity::Wallet::create();

  Transaction signed_tx(const std::string& payload) {
    Transaction tx = new_transaction(wallet.public_key(), TransactionType::GENERIC, to_bytes(payload));
    sign(tx, wallet.private_key());
    return tx;
  }

  static ErrorKind validation_error(const Blockchain& chain) {
    try {
      chain.validate();
    }
    catch (const Error& e) {
      return e.kind();
    }
    ADD_FAILURE() << "Expected validation to fail";
    return ErrorKind::NOT_FOUND;
  }
};

TEST_F(BlockchainTest, StartsWithFixedGenesis) {
  Blockchain chain;
  ASSERT_EQ(chain.size(), 1u);

  Block genesis = chain.latest_block();
  EXPECT_EQ(genesis.index, 0u);
  EXPECT_EQ(genesis.timestamp, 0);
  EXPECT_TRUE(genesis.transactions.empty());
  EXPECT_EQ(genesis.prev_hash, std::string(64, '0'));
  EXPECT_EQ(genesis.merkle_root, std::string(64, '0'));
  EXPECT_EQ(genesis.hash, compute_block_hash(genesis));

  // Same genesis on every node
  Blockchain other;
  EXPECT_EQ(other.latest_block(), genesis);
  EXPECT_TRUE(chain.is_valid());
}

TEST_F(BlockchainTest, AppendedBlocksLinkToTip) {
  Blockchain chain;
  Block first = chain.add_block({signed_tx("one")});
  Block second = chain.add_block({signed_tx("two"), signed_tx("three")});

  EXPECT_EQ(first.index, 1u);
  EXPECT_EQ(first.prev_hash, chain.block_at(0).hash);
  EXPECT_EQ(second.index, 2u);
  EXPECT_EQ(second.prev_hash, first.hash);
  EXPECT_EQ(chain.latest_block(), second);
  EXPECT_EQ(chain.size(), 3u);
  EXPECT_TRUE(chain.is_valid());
  EXPECT_NO_THROW(chain.validate());
}

TEST_F(BlockchainTest, ManyBlocksStayValid) {
  Blockchain chain;
  for (int i = 0; i < 20; ++i) {
    chain.add_block({signed_tx("tx " + std::to_string(i))});
  }
  EXPECT_EQ(chain.size(), 21u);
  EXPECT_TRUE(chain.is_valid());
}

TEST_F(BlockchainTest, RejectsUnsignedOrTamperedTransactions) {
  Blockchain chain;
  Transaction unsigned_tx = new_transaction(wallet.public_key(), TransactionType::GENERIC, to_bytes("x"));
  Transaction tampered = signed_tx("original");
  tampered.payload = to_bytes("forged");

  for (const auto& tx : {unsigned_tx, tampered}) {
    try {
      chain.add_block({signed_tx("fine"), tx});
      FAIL() << "Expected SIGNATURE_INVALID";
    }
    catch (const Error& e) {
      EXPECT_EQ(e.kind(), ErrorKind::SIGNATURE_INVALID);
      EXPECT_EQ(e.subject(), tx.id);
    }
  }
  EXPECT_EQ(chain.size(), 1u);
}

TEST_F(BlockchainTest, CorruptedStoredHashIsDetected) {
  Blockchain source;
  source.add_block({signed_tx("a")});
  source.add_block({signed_tx("b")});

  std::vector<Block> blocks = source.blocks();
  blocks[1].hash[0] = blocks[1].hash[0] == 'f' ? 'e' : 'f';
  Blockchain chain = Blockchain::from_blocks(blocks);

  EXPECT_FALSE(chain.is_valid());
  EXPECT_EQ(validation_error(chain), ErrorKind::CHAIN_LINKAGE_BROKEN);
}

TEST_F(BlockchainTest, TamperedPayloadIsDetected) {
  Blockchain source;
  source.add_block({signed_tx("a")});
  source.add_block({signed_tx("b")});

  std::vector<Block> blocks = source.blocks();
  blocks[2].transactions[0].payload = to_bytes("changed");
  Blockchain chain = Blockchain::from_blocks(blocks);
  EXPECT_FALSE(chain.is_valid());
}

TEST_F(BlockchainTest, RehashedTamperingStillBreaksLinkage) {
  Blockchain source;
  source.add_block({signed_tx("a")});
  source.add_block({signed_tx("b")});

  // Recompute block 1 after editing it; block 2 still points at the old hash
  std::vector<Block> blocks = source.blocks();
  blocks[1].timestamp += 1;
  blocks[1].hash = compute_block_hash(blocks[1]);
  Blockchain chain = Blockchain::from_blocks(blocks);

  EXPECT_FALSE(chain.is_valid());
  EXPECT_EQ(validation_error(chain), ErrorKind::CHAIN_LINKAGE_BROKEN);
}

TEST_F(BlockchainTest, ForgedSignatureWithConsistentHashesIsDetected) {
  Blockchain source;
  source.add_block({signed_tx("a")});

  // Rebuild the block around a mutated transaction so every hash is consistent
  std::vector<Block> blocks = source.blocks();
  blocks[1].transactions[0].payload = to_bytes("forged");
  blocks[1].merkle_root = compute_merkle_root(blocks[1].transactions);
  blocks[1].hash = compute_block_hash(blocks[1]);
  Blockchain chain = Blockchain::from_blocks(blocks);

  EXPECT_EQ(validation_error(chain), ErrorKind::SIGNATURE_INVALID);
}

TEST_F(BlockchainTest, FromBlocksRequiresGenesis) {
  EXPECT_THROW(Blockchain::from_blocks({}), Error);

  std::vector<Block> blocks = Blockchain().blocks();
  blocks[0].prev_hash = crypto::sha256_hex(std::string("not genesis"));
  blocks[0].hash = compute_block_hash(blocks[0]);
  EXPECT_FALSE(Blockchain::from_blocks(blocks).is_valid());
}

TEST_F(BlockchainTest, QueriesBlocksAndTransactions) {
  Blockchain chain;
  Transaction tx = signed_tx("find me");
  chain.add_block({tx});

  auto found = chain.find_transaction(tx.id);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(*found, tx);
  EXPECT_FALSE(chain.find_transaction("missing").has_value());

  try {
    chain.block_at(5);
    FAIL() << "Expected NOT_FOUND";
  }
  catch (const Error& e) {
    EXPECT_EQ(e.kind(), ErrorKind::NOT_FOUND);
  }

  // Snapshots do not alias the chain
  std::vector<Block> snapshot = chain.blocks();
  snapshot.pop_back();
  EXPECT_EQ(chain.size(), 2u);
}

TEST_F(BlockchainTest, MerkleRootProperties) {
  Transaction a = signed_tx("a");
  Transaction b = signed_tx("b");
  Transaction c = signed_tx("c");

  EXPECT_EQ(compute_merkle_root({}), std::string(64, '0'));
  EXPECT_EQ(compute_merkle_root({a}), crypto::to_hex(transaction_hash(a)));
  EXPECT_NE(compute_merkle_root({a, b}), compute_merkle_root({b, a}));
  EXPECT_NE(compute_merkle_root({a, b, c}), compute_merkle_root({a, b}));
}

TEST_F(BlockchainTest, RepeatedTransactionInStoredBlockIsDetected) {
  Blockchain source;
  Transaction c = signed_tx("c");
  source.add_block({signed_tx("a"), signed_tx("b"), c});

  // Repeating the last transaction leaves the merkle root and block hash unchanged
  std::vector<Block> blocks = source.blocks();
  blocks[1].transactions.push_back(c);
  ASSERT_EQ(compute_merkle_root(blocks[1].transactions), blocks[1].merkle_root);
  Blockchain chain = Blockchain::from_blocks(blocks);

  EXPECT_FALSE(chain.is_valid());
  EXPECT_EQ(validation_error(chain), ErrorKind::CHAIN_LINKAGE_BROKEN);
}

TEST_F(BlockchainTest, TransactionRecordedInTwoBlocksIsDetected) {
  Blockchain source;
  Transaction tx = signed_tx("twice");
  source.add_block({tx});

  // Second block replays tx with every hash recomputed
  std::vector<Block> blocks = source.blocks();
  blocks.push_back(make_block(2, {signed_tx("other"), tx}, blocks[1].hash));

  EXPECT_EQ(validation_error(Blockchain::from_blocks(blocks)), ErrorKind::CHAIN_LINKAGE_BROKEN);
}

TEST_F(BlockchainTest, AddBlockRejectsDuplicateTransactions) {
  Blockchain chain;
  Transaction tx = signed_tx("once");

  try {
    chain.add_block({tx, tx});
    FAIL() << "Expected INVALID_ARGUMENT";
  }
  catch (const Error& e) {
    EXPECT_EQ(e.kind(), ErrorKind::INVALID_ARGUMENT);
    EXPECT_EQ(e.subject(), tx.id);
  }
  EXPECT_EQ(chain.size(), 1u);

  chain.add_block({tx});
  EXPECT_THROW(chain.add_block({signed_tx("fresh"), tx}), Error);
  EXPECT_EQ(chain.size(), 2u);
  EXPECT_TRUE(chain.is_valid());
}

TEST_F(BlockchainTest, GenesisMustMatchExactly) {
  std::vector<Block> blocks = Blockchain().blocks();
  blocks[0].transactions.push_back(signed_tx("smuggled"));
  blocks[0].merkle_root = compute_merkle_root(blocks[0].transactions);
  blocks[0].hash = compute_block_hash(blocks[0]);
  EXPECT_EQ(validation_error(Blockchain::from_blocks(blocks)), ErrorKind::CHAIN_LINKAGE_BROKEN);

  blocks = Blockchain().blocks();
  blocks[0].timestamp = 42;
  blocks[0].hash = compute_block_hash(blocks[0]);
  EXPECT_FALSE(Blockchain::from_blocks(blocks).is_valid());
}

TEST_F(BlockchainTest, ConcurrentAppendsAreSerialized) {
  Blockchain chain;
  std::vector<Transaction> txs;
  for (int i = 0; i < 40; ++i) {
    txs.push_back(signed_tx("concurrent " + std::to_string(i)));
  }

  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&chain, &txs, t]() {
      for (std::size_t i = t; i < txs.size(); i += 4) {
        chain.add_block({txs[i]});
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(chain.size(), 41u);
  EXPECT_TRUE(chain.is_valid());
}
