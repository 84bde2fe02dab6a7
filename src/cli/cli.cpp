#include "cli/cli.hpp"
#include <sstream>
#include <boost/log/trivial.hpp>

namespace memblob {
namespace cli {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(store::BlobStore& store, std::istream& input, std::ostream& output)
  : running_(false)
  , store_(store)
  , input_(input)
  , output_(output) {
  BOOST_LOG_TRIVIAL(info) << "CLI initialized";
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "Starting CLI loop";
  output_ << "memblob> " << std::flush;

  while (running_ && std::getline(input_, line)) {
    running_ = execute(line);
    if (running_) {
      output_ << "memblob> " << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI loop ended";
}

bool CLI::execute(const std::string& line) {
  std::istringstream args(line);
  std::string command;
  args >> command;

  if (command.empty()) {
    return true;
  }
  if (command == "quit") {
    return false;
  }

  BOOST_LOG_TRIVIAL(debug) << "Processing command: " << line;

  try {
    if (command == "mkc") {
      handle_make_container(args);
    } else if (command == "rmc") {
      handle_remove_container(args);
    } else if (command == "lsc") {
      handle_list_containers();
    } else if (command == "put") {
      handle_put(args);
    } else if (command == "get") {
      handle_get(args);
    } else if (command == "head") {
      handle_head(args);
    } else if (command == "rm") {
      handle_remove(args);
    } else if (command == "ls") {
      handle_list(args);
    } else if (command == "help") {
      handle_help_command();
    } else {
      output_ << "Unknown command: " << command << std::endl;
    }
  } catch (const store::StoreError& e) {
    log_and_display_error(std::string("Error ") + std::to_string(store::error_code_to_status(e.code())),
                          e.what());
  } catch (const std::exception& e) {
    log_and_display_error("Error", e.what());
  }
  return true;
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::handle_make_container(std::istringstream& args) {
  std::string name, location;
  if (!(args >> name)) {
    output_ << "Usage: mkc <container> [location]" << std::endl;
    return;
  }
  args >> location;
  bool created = store_.create_container(name, location);
  output_ << (created ? "Created container " : "Container already exists: ") << name << std::endl;
}

void CLI::handle_remove_container(std::istringstream& args) {
  std::string name, flag;
  if (!(args >> name)) {
    output_ << "Usage: rmc <container> [--if-empty]" << std::endl;
    return;
  }
  if (args >> flag && flag == "--if-empty") {
    bool deleted = store_.delete_container_if_empty(name);
    output_ << (deleted ? "Deleted container " : "Container not empty: ") << name << std::endl;
    return;
  }
  store_.delete_container(name);
  output_ << "Deleted container " << name << std::endl;
}

void CLI::handle_list_containers() {
  for (const auto& entry : store_.list_containers().entries) {
    output_ << "  [CONTAINER] " << entry.name << " (" << entry.location.value_or("") << ")" << std::endl;
  }
}

void CLI::handle_put(std::istringstream& args) {
  std::string container, key;
  if (!(args >> container >> key)) {
    output_ << "Usage: put <container> <key> <text>" << std::endl;
    return;
  }
  std::string text;
  std::getline(args >> std::ws, text);
  std::string etag = store_.put_blob(container, key, text);
  output_ << "Stored " << container << "/" << key << " etag " << etag << std::endl;
}

void CLI::handle_get(std::istringstream& args) {
  std::string container, key, range;
  if (!(args >> container >> key)) {
    output_ << "Usage: get <container> <key> [range]" << std::endl;
    return;
  }
  conditional::GetOptions options;
  if (args >> range) {
    options.ranges.push_back(range);
  }
  auto blob = store_.get_blob(container, key, options);
  if (!blob) {
    output_ << "Not found: " << container << "/" << key << std::endl;
    return;
  }
  output_ << blob->payload_string() << std::endl;
}

void CLI::handle_head(std::istringstream& args) {
  std::string container, key;
  if (!(args >> container >> key)) {
    output_ << "Usage: head <container> <key>" << std::endl;
    return;
  }
  auto blob = store_.get_blob(container, key);
  if (!blob) {
    output_ << "Not found: " << container << "/" << key << std::endl;
    return;
  }
  for (const auto& [name, value] : blob->headers()) {
    output_ << "  " << name << ": " << value << std::endl;
  }
}

void CLI::handle_remove(std::istringstream& args) {
  std::string container, key;
  if (!(args >> container >> key)) {
    output_ << "Usage: rm <container> <key>" << std::endl;
    return;
  }
  store_.delete_blob(container, key);
  output_ << "Removed " << container << "/" << key << std::endl;
}

void CLI::handle_list(std::istringstream& args) {
  std::string container;
  if (!(args >> container)) {
    output_ << "Usage: ls <container> [prefix] [-r]" << std::endl;
    return;
  }
  listing::ListOptions options;
  std::string token;
  while (args >> token) {
    if (token == "-r") {
      options.recursive = true;
    } else {
      options.prefix = token;
    }
  }

  store::Page page = store_.list_blobs(container, options);
  for (const auto& entry : page.entries) {
    output_ << "  " << (entry.type == store::StorageType::RELATIVE_PATH ? "[DIR] " : "[BLOB]")
            << " " << entry.name << std::endl;
  }
  if (page.next_marker) {
    output_ << "  (more after " << *page.next_marker << ")" << std::endl;
  }
}

void CLI::handle_help_command() {
  output_ << "Available commands:" << std::endl;
  output_ << "  help                        Display this help message" << std::endl;
  output_ << "  mkc <c> [location]          Create container <c>" << std::endl;
  output_ << "  rmc <c> [--if-empty]        Delete container <c>" << std::endl;
  output_ << "  lsc                         List containers" << std::endl;
  output_ << "  put <c> <key> <text>        Store <text> under <key>" << std::endl;
  output_ << "  get <c> <key> [range]       Print a blob, optionally a byte range" << std::endl;
  output_ << "  head <c> <key>              Print blob headers" << std::endl;
  output_ << "  rm <c> <key>                Delete a blob" << std::endl;
  output_ << "  ls <c> [prefix] [-r]        List blobs" << std::endl;
  output_ << "  quit                        Exit the shell" << std::endl << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error;
  output_ << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace memblob
