#include "config/store_config.hpp"
#include <unordered_set>

namespace memblob::config {

void print_usage(const std::string& program_name, std::ostream& out) {
  out << "Usage: " << program_name << " [options]\n"
      << "Options:\n"
      << "  -l, --location <name>     Default container location (default: default)\n"
      << "  -s, --scheme <scheme>     Scheme of synthetic blob URIs (default: mem)\n"
      << "  -m, --max-results <n>     Default listing page size (default: 1000)\n"
      << "  -c, --seed <container>    Container created at startup, repeatable\n"
      << "  -f, --log-file <path>     Log file (default: memblob.log)\n"
      << "  -v, --log-level <level>   trace, debug, info, warning, error or fatal\n"
      << "      --help                Show this message\n"
      << "Example: " << program_name << " -c stub -v debug\n";
}

ProgramOptions parse_command_line(int argc, const char* const argv[], std::ostream& err) {
  const std::unordered_set<std::string> flags = {
    "-l", "--location",
    "-s", "--scheme",
    "-m", "--max-results",
    "-c", "--seed",
    "-f", "--log-file",
    "-v", "--log-level"
  };

  ProgramOptions options;
  const std::string program_name = argc > 0 ? argv[0] : "memblob_shell";

  for (int i = 1; i < argc; ++i) {
    const std::string flag(argv[i]);

    if (flag == "--help" || flag == "-h") {
      options.show_help = true;
      options.valid = true;
      return options;
    }

    if (flags.count(flag) == 0) {
      err << "Error: Unknown argument: " << flag << '\n';
      print_usage(program_name, err);
      return options;
    }

    if (i + 1 >= argc) {
      err << "Error: Missing value for " << flag << '\n';
      print_usage(program_name, err);
      return options;
    }
    const std::string value(argv[++i]);

    if (flag == "-l" || flag == "--location") {
      options.config.default_location = value;
    } else if (flag == "-s" || flag == "--scheme") {
      options.config.uri_scheme = value;
    } else if (flag == "-m" || flag == "--max-results") {
      try {
        options.config.default_max_results = std::stoi(value);
      } catch (const std::exception&) {
        err << "Error: Invalid max results: " << value << '\n';
        print_usage(program_name, err);
        return options;
      }
    } else if (flag == "-c" || flag == "--seed") {
      options.config.seed_containers.push_back(value);
    } else if (flag == "-f" || flag == "--log-file") {
      options.config.log_file = value;
    } else if (flag == "-v" || flag == "--log-level") {
      auto level = logging::parse_severity(value);
      if (!level) {
        err << "Error: Invalid log level: " << value << '\n';
        print_usage(program_name, err);
        return options;
      }
      options.config.log_level = *level;
    }
  }

  if (options.config.uri_scheme.empty()) {
    err << "Error: URI scheme must not be empty\n";
    print_usage(program_name, err);
    return options;
  }

  options.valid = true;
  return options;
}

} // namespace memblob::config
