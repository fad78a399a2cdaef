#include "cli/cli.hpp"
#include <fstream>
#include <iterator>
#include <sstream>
#include <vector>
#include <boost/log/trivial.hpp>
#include "ledger/transaction.hpp"

namespace dsb {
namespace cli {

namespace {

bool read_file(const std::string& filename, Bytes& data) {
  std::ifstream file(filename, std::ios::binary);
  if (!file) {
    return false;
  }
  data.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
  return !file.bad();
}

} // namespace

//==============================================
// CONSTRUCTOR
//==============================================

CLI::CLI(content::DdsService& dds, ledger::Blockchain& chain, const identity::Wallet& wallet,
         std::istream& in, std::ostream& out)
  : dds_(dds)
  , chain_(chain)
  , wallet_(wallet)
  , in_(in)
  , out_(out) {
  BOOST_LOG_TRIVIAL(info) << "CLI: Initialized for wallet " << wallet_.address();
}

//==============================================
// STARTUP
//==============================================

void CLI::run() {
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "CLI: Starting shell loop";
  out_ << "DSB_Shell> " << std::flush;

  while (std::getline(in_, line)) {
    if (!execute(line)) {
      break;
    }
    out_ << "DSB_Shell> " << std::flush;
  }

  BOOST_LOG_TRIVIAL(info) << "CLI: Shell loop ended";
}

bool CLI::execute(const std::string& line) {
  std::istringstream iss(line);
  std::string command, argument, extra;
  iss >> command >> argument >> extra;

  if (command.empty()) {
    return true;
  }
  BOOST_LOG_TRIVIAL(debug) << "CLI: Processing command: " << command << " " << argument;

  if (command == "quit" || command == "exit") {
    return false;
  }
  else if (command == "help") {
    handle_help_command();
  }
  else if (command == "chain") {
    handle_chain_command();
  }
  else if (command == "validate") {
    handle_validate_command();
  }
  else if (argument.empty()) {
    out_ << "Invalid input. Usage: <command> <argument>, or help" << std::endl;
  }
  else if (command == "publish") {
    handle_publish_command(argument);
  }
  else if (command == "get") {
    handle_get_command(argument, extra);
  }
  else if (command == "post") {
    handle_post_command(argument);
  }
  else {
    out_ << "Unknown command: " << command << std::endl;
  }
  return true;
}

//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::handle_publish_command(const std::string& filename) {
  Bytes data;
  if (!read_file(filename, data)) {
    out_ << "Error opening file: " << filename << std::endl;
    return;
  }
  try {
    const content::ManifestId id = dds_.publish(data);
    out_ << "Published " << data.size() << " bytes as " << id << std::endl;
  }
  catch (const Error& e) {
    log_and_display_error("Error publishing " + filename, e.what());
  }
}

void CLI::handle_get_command(const std::string& manifest_id, const std::string& out_file) {
  Bytes data;
  try {
    data = dds_.retrieve(manifest_id);
  }
  catch (const Error& e) {
    log_and_display_error(std::string("Error retrieving content (") + error_kind_to_string(e.kind()) + ")",
                          e.what());
    return;
  }

  if (out_file.empty()) {
    out_ << dsb::to_string(data) << std::endl;
    return;
  }
  std::ofstream file(out_file, std::ios::binary | std::ios::trunc);
  file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
  if (!file) {
    out_ << "Error writing file: " << out_file << std::endl;
    return;
  }
  out_ << "Wrote " << data.size() << " bytes to " << out_file << std::endl;
}

void CLI::handle_post_command(const std::string& filename) {
  Bytes data;
  if (!read_file(filename, data)) {
    out_ << "Error opening file: " << filename << std::endl;
    return;
  }
  try {
    const content::ManifestId id = dds_.publish(data);
    ledger::Transaction tx = ledger::content_reference_transaction(wallet_.public_key(), id);
    ledger::sign(tx, wallet_.private_key());
    const ledger::Block block = chain_.add_block({tx});
    out_ << "Posted " << id << " in transaction " << tx.id << " (block " << block.index << ")" << std::endl;
  }
  catch (const Error& e) {
    log_and_display_error("Error posting " + filename, e.what());
  }
  catch (const crypto::CryptoError& e) {
    log_and_display_error("Error signing post for " + filename, e.what());
  }
}

void CLI::handle_chain_command() {
  for (const auto& block : chain_.blocks()) {
    out_ << "#" << block.index << " " << block.hash << " (" << block.transactions.size() << " transactions)"
         << std::endl;
    for (const auto& tx : block.transactions) {
      out_ << "    " << tx.id << " " << ledger::transaction_type_to_string(tx.type);
      if (tx.type == ledger::TransactionType::POST_CREATED) {
        out_ << " " << dsb::to_string(tx.payload);
      }
      out_ << std::endl;
    }
  }
}

void CLI::handle_validate_command() {
  try {
    chain_.validate();
    out_ << "Chain is valid (" << chain_.size() << " blocks)" << std::endl;
  }
  catch (const Error& e) {
    log_and_display_error("Chain is invalid", e.what());
  }
}

void CLI::handle_help_command() {
  out_ << "Available commands:" << std::endl;
  out_ << "  help                Display this help message" << std::endl;
  out_ << "  publish <file>      Store <file> and print its manifest id" << std::endl;
  out_ << "  get <id> [file]     Retrieve content by manifest id, print it or write it to [file]" << std::endl;
  out_ << "  post <file>         Publish <file> and anchor it in a signed ledger transaction" << std::endl;
  out_ << "  chain               List blocks and transactions" << std::endl;
  out_ << "  validate            Verify hashes, linkage and signatures of the chain" << std::endl;
  out_ << "  quit                Exit the shell" << std::endl << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << "CLI: " << message << ": " << error;
  out_ << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace dsb
