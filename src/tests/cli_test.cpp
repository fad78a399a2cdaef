#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include "cli/cli.hpp"
#include "ledger/transaction.hpp"
#include "store/memory_storage.hpp"
#include "test_utils.hpp"

using namespace dsb;

class CliTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  std::shared_ptr<store::InMemoryStorage> storage = std::make_shared<store::InMemoryStorage>();
  content::DdsService dds{content::Chunker(8), storage};
  ledger::Blockchain chain;
  identity::Wallet wallet = identity::Wallet::create();
  std::istringstream in;
  std::ostringstream out;
  std::unique_ptr<cli::CLI> shell;

  void SetUp() override {
    init_logging();
    test_dir = make_temp_dir("cli_test");
    shell = std::make_unique<cli::CLI>(dds, chain, wallet, in, out);
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(test_dir, ec);
  }

  std::string write_file(const std::string& name, const std::string& text) {
    auto path = test_dir / name;
    std::ofstream file(path, std::ios::binary);
    file << text;
    return path.string();
  }

  // Manifest id printed by the last publish or post
  std::string last_manifest_id() {
    const std::string text = out.str();
    std::size_t pos = text.rfind(" as ");
    return pos == std::string::npos ? "" : text.substr(pos + 4, 64);
  }
};

TEST_F(CliTest, PublishThenGet) {
  std::string path = write_file("note.txt", "Hello, Digisocialblock!");
  EXPECT_TRUE(shell->execute("publish " + path));
  std::string id = last_manifest_id();
  ASSERT_EQ(id.size(), 64u) << out.str();

  std::string target = (test_dir / "copy.txt").string();
  EXPECT_TRUE(shell->execute("get " + id + " " + target));

  std::ifstream copy(target, std::ios::binary);
  std::stringstream ss;
  ss << copy.rdbuf();
  EXPECT_EQ(ss.str(), "Hello, Digisocialblock!");
}

TEST_F(CliTest, PostAnchorsContentInChain) {
  std::string path = write_file("post.txt", "my first post");
  EXPECT_TRUE(shell->execute("post " + path));

  ASSERT_EQ(chain.size(), 2u);
  const ledger::Block block = chain.latest_block();
  ASSERT_EQ(block.transactions.size(), 1u);
  const ledger::Transaction& tx = block.transactions[0];
  EXPECT_EQ(tx.type, ledger::TransactionType::POST_CREATED);
  EXPECT_TRUE(ledger::verify(tx));
  EXPECT_EQ(to_string(dds.retrieve(ledger::manifest_id_from_payload(tx))), "my first post");

  EXPECT_TRUE(shell->execute("chain"));
  EXPECT_NE(out.str().find("POST_CREATED"), std::string::npos);
  EXPECT_TRUE(shell->execute("validate"));
  EXPECT_NE(out.str().find("Chain is valid"), std::string::npos);
}

TEST_F(CliTest, ReportsErrorsAndKeepsRunning) {
  EXPECT_TRUE(shell->execute("publish /no/such/file"));
  EXPECT_NE(out.str().find("Error opening file"), std::string::npos);

  EXPECT_TRUE(shell->execute("get " + std::string(64, 'a')));
  EXPECT_NE(out.str().find("Manifest not found"), std::string::npos);

  EXPECT_TRUE(shell->execute("frobnicate x"));
  EXPECT_NE(out.str().find("Unknown command"), std::string::npos);
}

TEST_F(CliTest, RunStopsAtQuit) {
  in.str("help\nquit\nchain\n");
  shell->run();
  EXPECT_NE(out.str().find("Available commands"), std::string::npos);
  EXPECT_EQ(out.str().find("#0"), std::string::npos);
  EXPECT_FALSE(shell->execute("quit"));
}
