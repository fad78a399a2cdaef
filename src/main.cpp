#include <iostream>
#include <memory>
#include <string>
#include <boost/log/trivial.hpp>
#include "cli/cli.hpp"
#include "config/config.hpp"
#include "content/dds_service.hpp"
#include "identity/wallet.hpp"
#include "ledger/blockchain.hpp"
#include "logger/logger.hpp"
#include "store/disk_storage.hpp"
#include "store/memory_storage.hpp"
#include "utils/worker_pool.hpp"

namespace {

std::shared_ptr<dsb::store::Storage> make_storage(const dsb::config::NodeConfig& config) {
  if (config.storage_dir.empty()) {
    BOOST_LOG_TRIVIAL(info) << "Node: Using in-memory storage";
    return std::make_shared<dsb::store::InMemoryStorage>();
  }
  return std::make_shared<dsb::store::DiskStorage>(config.storage_dir);
}

bool run_node(const dsb::config::NodeConfig& config) {
  try {
    if (config.log_file.empty()) {
      dsb::logging::init_console_logging(config.log_level);
    } else {
      dsb::logging::init_logging(config.log_file, config.log_level);
    }

    std::shared_ptr<dsb::utils::WorkerPool> pool;
    if (config.worker_threads > 0) {
      pool = std::make_shared<dsb::utils::WorkerPool>(config.worker_threads);
    }

    dsb::content::DdsService dds(dsb::content::Chunker(config.chunk_size), make_storage(config), nullptr, pool,
                                 config.fetch_timeout);
    dsb::ledger::Blockchain chain;
    const dsb::identity::Wallet wallet = dsb::identity::Wallet::create();

    std::cout << "Node address: " << wallet.address() << '\n';
    dsb::cli::CLI cli(dds, chain, wallet);
    cli.run();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to run node: " << e.what() << '\n';
    return false;
  }
}

} // namespace

int main(int argc, char* argv[]) {
  const auto options = dsb::config::parse_command_line(argc, argv, std::cerr);
  if (!options.valid) {
    return 1;
  }
  if (options.show_help) {
    dsb::config::print_usage(argv[0], std::cout);
    return 0;
  }
  return run_node(options.config) ? 0 : 1;
}
