#include "xt_main.hpp"

#include <fstream>
#include <iostream>
#include <string>

static constexpr int exit_success = 0;
static constexpr int exit_usage = 1;
static constexpr int exit_io = 2;
static constexpr int exit_config = 3;

static void
print_usage(std::ostream& os) {
  os << "Usage: xt list|run [options] <manifest-pattern> [...]\n"
     << "\n"
     << "Commands:\n"
     << "  list                 Print the generated test units\n"
     << "  run                  Run the generated test units\n"
     << "\n"
     << "Options:\n"
     << "  --label <name>       Test label (default: validation)\n"
     << "  --suffix <ext>       Target file suffix, xml or xsd (default: "
        "xml)\n"
     << "  --base-dir <dir>     Base for relative test names (default: "
        "current directory)\n"
     << "  --config <file>      JSON file with default option values\n"
     << "  --json               Print the unit list as JSON (list)\n"
     << "  --verbose            Report skipped directives on stderr\n"
     << "  -h, --help           Show this help message\n"
     << "  --version            Show version information\n";
}

static void
print_version(std::ostream& os) {
  os << "xt " << XT_VERSION << "\n";
}

// Seeds the configuration from a JSON file. Command line options given
// afterwards override its keys.
static int
load_config(const std::string& path, nlohmann::json& config) {
  std::ifstream in(path);
  if (!in) {
    std::cerr << "xt: cannot open file: " << path << "\n";
    return exit_io;
  }
  nlohmann::json file_config;
  try {
    in >> file_config;
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "xt: invalid configuration " << path << ": " << e.what()
              << "\n";
    return exit_config;
  }
  if (!file_config.is_object()) {
    std::cerr << "xt: configuration " << path << " is not a JSON object\n";
    return exit_config;
  }
  config.update(file_config);
  return exit_success;
}

int
main(int argc, char* argv[]) {
  nlohmann::json config = nlohmann::json::object();
  nlohmann::json options = nlohmann::json::object();
  auto patterns = nlohmann::json::array();

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      print_usage(std::cerr);
      return exit_success;
    }

    if (arg == "--version") {
      print_version(std::cerr);
      return exit_success;
    }

    if (arg == "--json" || arg == "--verbose") {
      options[arg.substr(2)] = true;
      continue;
    }

    if (arg == "--label" || arg == "--suffix" || arg == "--base-dir" ||
        arg == "--config") {
      if (i + 1 >= argc) {
        std::cerr << "xt: " << arg << " requires an argument\n";
        return exit_usage;
      }
      std::string value = argv[++i];
      if (arg == "--config") {
        if (int rc = load_config(value, config); rc != exit_success) return rc;
      } else {
        options[arg.substr(2)] = value;
      }
      continue;
    }

    if (arg.size() > 1 && arg[0] == '-') {
      std::cerr << "xt: unknown option: " << arg << "\n";
      return exit_usage;
    }

    if (!options.contains("command")) {
      options["command"] = arg;
      continue;
    }
    patterns.push_back(arg);
  }

  config.update(options);
  if (!patterns.empty()) config["patterns"] = patterns;

  if (!config.contains("command")) {
    std::cerr << "xt: no command given\n";
    print_usage(std::cerr);
    return exit_usage;
  }

  return xt_cli::run(config);
}
