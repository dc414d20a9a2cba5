#pragma once

#include <xt/schema_fwd.hpp>

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace xt {

  // Malformed manifest content or an inconsistent test table. Raised at
  // load time; nothing catches it on the way to the caller.
  class configuration_error : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  // One parsed manifest line:
  //
  //   <filename> [<expected-errors>] [-i] [-v=1.0|-v=1.1]
  struct directive {
    std::string filename;
    std::size_t expected_errors = 0;
    bool inspect = false;
    schema_version version = schema_version::v1_0;

    bool
    operator==(const directive&) const = default;
  };

  // Throws configuration_error for anything but "1.0" and "1.1".
  schema_version
  parse_schema_version(std::string_view text);

  // Splits a directive on unescaped blanks. "\ " is a literal space and "\#"
  // a literal '#'; other backslashes are kept as they are. Empty tokens are
  // dropped.
  std::vector<std::string>
  split_directive_args(std::string_view text);

  // Parses one manifest line. Blank lines and comment lines yield nullopt;
  // an unescaped '#' starts a trailing comment. Malformed directives throw
  // configuration_error.
  std::optional<directive>
  parse_directive(std::string_view line);

} // namespace xt
