#include "xt_main.hpp"

#include <xt/test_procedures.hpp>

#include <exception>
#include <iostream>
#include <string>
#include <vector>

namespace {

  constexpr int exit_success = 0;
  constexpr int exit_usage = 1;
  constexpr int exit_io = 2;
  constexpr int exit_config = 3;
  constexpr int exit_failures = 5;

  struct command_options {
    std::string command;
    std::vector<std::string> patterns;
    xt::factory_options factory;
    bool json = false;
    bool verbose = false;
  };

  command_options
  read_options(const nlohmann::json& config) {
    command_options opts;
    opts.command = config.value("command", "");
    if (config.contains("patterns") && config["patterns"].is_array()) {
      for (const auto& p : config["patterns"])
        opts.patterns.push_back(p.get<std::string>());
    }
    opts.factory.label = config.value("label", "validation");
    opts.factory.suffix = config.value("suffix", "xml");
    opts.factory.base_dir = config.value("base-dir", "");
    opts.json = config.value("json", false);
    opts.verbose = config.value("verbose", false);
    return opts;
  }

  // Schema documents get schema-build tests, anything else is treated as an
  // instance document.
  xt::test_builder
  builder_for(const std::string& suffix, xt::component_record& record) {
    if (suffix == "xsd" || suffix == ".xsd")
      return xt::schema_test_builder(record);
    return xt::validation_test_builder(record);
  }

  // Loads the suite, mapping load failures to exit codes. Returns
  // exit_success when `suite` is ready.
  int
  load_suite(const command_options& opts, const std::string& prefix,
             xt::component_record& record, xt::test_suite& suite) {
    auto factory = opts.factory;
    if (opts.verbose) {
      factory.on_skip = [&prefix](const std::filesystem::path& manifest,
                                  std::size_t line,
                                  const std::filesystem::path& file,
                                  xt::skip_reason reason) {
        std::cerr << prefix << ": " << manifest.string() << ":" << line
                  << ": skipped " << file.string() << " ("
                  << xt::to_string(reason) << ")\n";
      };
    }

    try {
      auto stats = xt::tests_factory(builder_for(opts.factory.suffix, record),
                                     opts.patterns, xt::default_variants(record),
                                     factory, suite);
      if (opts.verbose) {
        std::cerr << prefix << ": " << stats.manifests << " manifest(s), "
                  << stats.directives << " directive(s), " << stats.resolved
                  << " resolved, "
                  << stats.skipped_missing + stats.skipped_suffix
                  << " skipped\n";
      }
    } catch (const xt::configuration_error& e) {
      std::cerr << prefix << ": " << e.what() << "\n";
      return exit_config;
    } catch (const std::exception& e) {
      std::cerr << prefix << ": " << e.what() << "\n";
      return exit_io;
    }
    return exit_success;
  }

  nlohmann::json
  unit_to_json(const xt::test_unit& unit) {
    const auto& input = unit.input;
    return {
        {"class", unit.class_name},
        {"method", unit.method_name},
        {"file", input.file_path.string()},
        {"variant", std::string(xt::to_string(input.variant))},
        {"expected_errors", input.expected_errors},
        {"inspect", input.inspect},
        {"version", std::string(xt::to_string(input.version))},
        {"manifest", input.manifest.string()},
        {"line", input.line},
    };
  }

  // ---------------------------------------------------------------------------
  // list
  // ---------------------------------------------------------------------------

  int
  run_list(const command_options& opts) {
    xt::component_record record;
    xt::test_suite suite;
    if (int rc = load_suite(opts, "xt list", record, suite); rc != exit_success)
      return rc;

    if (opts.json) {
      auto units = nlohmann::json::array();
      for (const auto& unit : suite)
        units.push_back(unit_to_json(unit));
      std::cout << units.dump(2) << "\n";
      return exit_success;
    }

    for (const auto& unit : suite)
      std::cout << unit.class_name << "." << unit.method_name << "\n";
    return exit_success;
  }

  // ---------------------------------------------------------------------------
  // run
  // ---------------------------------------------------------------------------

  int
  run_run(const command_options& opts) {
    xt::component_record record;
    xt::test_suite suite;
    if (int rc = load_suite(opts, "xt run", record, suite); rc != exit_success)
      return rc;

    std::size_t failed = 0;
    for (const auto& unit : suite) {
      try {
        unit.run();
        std::cout << "ok      " << unit.class_name << "." << unit.method_name
                  << "\n";
      } catch (const std::exception& e) {
        ++failed;
        std::cout << "FAILED  " << unit.class_name << "." << unit.method_name
                  << "\n";
        std::cerr << "xt run: " << unit.method_name << ": " << e.what()
                  << "\n";
      }
    }

    std::cout << suite.size() - failed << " passed, " << failed << " failed\n";
    return failed == 0 ? exit_success : exit_failures;
  }

} // anonymous namespace

int
xt_cli::run(const nlohmann::json& config) {
  command_options opts;
  try {
    opts = read_options(config);
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "xt: invalid configuration: " << e.what() << "\n";
    return exit_config;
  }

  if (opts.patterns.empty()) {
    std::cerr << "xt: no manifest patterns given\n";
    return exit_usage;
  }

  if (opts.command == "list") return run_list(opts);
  if (opts.command == "run") return run_run(opts);

  std::cerr << "xt: unknown command: " << opts.command << "\n";
  return exit_usage;
}
