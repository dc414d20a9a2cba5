#pragma once

#include <nlohmann/json.hpp>

// Entry point shared by main() and the command handlers. The configuration
// object carries the parsed command line:
//
//   command    "list" or "run"
//   patterns   manifest glob patterns
//   label, suffix, base-dir, json, verbose
struct xt_cli {
  static int
  run(const nlohmann::json& config);
};
