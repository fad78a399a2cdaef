#pragma once

#include <iostream>
#include <string>
#include "content/dds_service.hpp"
#include "identity/wallet.hpp"
#include "ledger/blockchain.hpp"

namespace dsb {
namespace cli {

// Interactive node shell over the data store and the ledger
class CLI {
public:
  // ---- CONSTRUCTOR ----
  CLI(content::DdsService& dds, ledger::Blockchain& chain, const identity::Wallet& wallet,
      std::istream& in = std::cin, std::ostream& out = std::cout);


  // ---- STARTUP ----
  // Reads commands until quit or end of input
  void run();
  // Runs a single command line; returns false once the shell should stop
  bool execute(const std::string& line);

private:
  // ---- PARAMETERS ----
  content::DdsService& dds_;
  ledger::Blockchain& chain_;
  const identity::Wallet& wallet_;
  std::istream& in_;
  std::ostream& out_;


  // ---- COMMAND PROCESSING ----
  void handle_publish_command(const std::string& filename);
  void handle_get_command(const std::string& manifest_id, const std::string& out_file);
  void handle_post_command(const std::string& filename);
  void handle_chain_command();
  void handle_validate_command();
  void handle_help_command();
  void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace dsb
