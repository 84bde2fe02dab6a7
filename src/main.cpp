#include "cli/cli.hpp"
#include "config/store_config.hpp"
#include "logger/logger.hpp"
#include "store/blob_store.hpp"
#include <iostream>

bool run_shell(const memblob::config::StoreConfig& config) {
  try {
    memblob::logging::init_logging(config.log_file, config.log_level);
    memblob::store::BlobStore store(config);
    memblob::cli::CLI cli(store, std::cin, std::cout);
    cli.run();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to start shell: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  auto options = memblob::config::parse_command_line(argc, argv, std::cerr);
  if (!options.valid) {
    return 1;
  }
  if (options.show_help) {
    memblob::config::print_usage(argv[0], std::cout);
    return 0;
  }
  if (options.config.seed_containers.empty()) {
    options.config.seed_containers.push_back("stub");
  }
  return run_shell(options.config) ? 0 : 1;
}
