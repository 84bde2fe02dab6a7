#ifndef MEMBLOB_STORE_CONFIG_HPP
#define MEMBLOB_STORE_CONFIG_HPP

#include <ostream>
#include <string>
#include <vector>
#include "../logger/logger.hpp"

namespace memblob::config {

struct StoreConfig {
  // Location given to containers created without one
  std::string default_location{"default"};
  std::string uri_scheme{"mem"};
  int default_max_results{1000};
  // Created when the store is constructed
  std::vector<std::string> seed_containers;
  std::string log_file{"memblob.log"};
  logging::severity_level log_level{logging::severity_level::info};
};

struct ProgramOptions {
  StoreConfig config;
  bool show_help{false};
  bool valid{false};
};

void print_usage(const std::string& program_name, std::ostream& out);

// Reads flag/value pairs; errors are reported on err and leave valid false
ProgramOptions parse_command_line(int argc, const char* const argv[], std::ostream& err);

} // namespace memblob::config

#endif // MEMBLOB_STORE_CONFIG_HPP
