#pragma once

#include <istream>
#include <sstream>
#include <ostream>
#include <string>
#include "store/blob_store.hpp"

namespace memblob {
namespace cli {

class CLI {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  CLI(store::BlobStore& store, std::istream& input, std::ostream& output);


  // ---- STARTUP ----
  // Reads commands until "quit" or end of input
  void run();
  // Runs one command line; false once the shell should stop
  bool execute(const std::string& line);

private:
  // ---- PARAMETERS ----
  bool running_;
  store::BlobStore& store_;
  std::istream& input_;
  std::ostream& output_;


  // ---- COMMAND PROCESSING ----
  void handle_make_container(std::istringstream& args);
  void handle_remove_container(std::istringstream& args);
  void handle_list_containers();
  void handle_put(std::istringstream& args);
  void handle_get(std::istringstream& args);
  void handle_head(std::istringstream& args);
  void handle_remove(std::istringstream& args);
  void handle_list(std::istringstream& args);
  void handle_help_command();
  void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace memblob
