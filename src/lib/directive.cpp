#include <xt/directive.hpp>

#include <charconv>
#include <string>

namespace xt {

  namespace {

    bool
    is_blank(char c) {
      return c == ' ' || c == '\t' || c == '\r' || c == '\n';
    }

    std::string_view
    trim(std::string_view s) {
      while (!s.empty() && is_blank(s.front()))
        s.remove_prefix(1);
      while (!s.empty() && is_blank(s.back()))
        s.remove_suffix(1);
      return s;
    }

    // Drops an unescaped '#' and everything after it.
    std::string_view
    strip_comment(std::string_view s) {
      for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '\\' && i + 1 < s.size()) {
          ++i;
          continue;
        }
        if (s[i] == '#') return s.substr(0, i);
      }
      return s;
    }

    std::size_t
    parse_count(const std::string& token) {
      std::size_t value = 0;
      auto [ptr, ec] =
          std::from_chars(token.data(), token.data() + token.size(), value);
      if (ec != std::errc{} || ptr != token.data() + token.size()) {
        throw configuration_error("invalid expected error count '" + token +
                                  "'");
      }
      return value;
    }

  } // namespace

  schema_version
  parse_schema_version(std::string_view text) {
    if (text == "1.0") return schema_version::v1_0;
    if (text == "1.1") return schema_version::v1_1;
    throw configuration_error("unsupported XSD version '" +
                              std::string(text) + "'");
  }

  std::vector<std::string>
  split_directive_args(std::string_view text) {
    std::vector<std::string> args;
    std::string current;
    for (std::size_t i = 0; i < text.size(); ++i) {
      char c = text[i];
      if (c == '\\' && i + 1 < text.size() &&
          (text[i + 1] == ' ' || text[i + 1] == '#')) {
        current += text[++i];
      } else if (c == ' ' || c == '\t') {
        if (!current.empty()) args.push_back(std::move(current));
        current.clear();
      } else {
        current += c;
      }
    }
    if (!current.empty()) args.push_back(std::move(current));
    return args;
  }

  std::optional<directive>
  parse_directive(std::string_view line) {
    auto text = trim(line);
    if (text.empty() || text.front() == '#') return std::nullopt;
    text = trim(strip_comment(text));
    if (text.empty()) return std::nullopt;

    auto args = split_directive_args(text);
    directive d;
    std::size_t positional = 0;
    for (std::size_t i = 0; i < args.size(); ++i) {
      const auto& arg = args[i];
      if (arg == "-i") {
        d.inspect = true;
      } else if (arg == "-v") {
        if (i + 1 >= args.size())
          throw configuration_error("-v requires a version");
        d.version = parse_schema_version(args[++i]);
      } else if (arg.starts_with("-v=")) {
        d.version = parse_schema_version(std::string_view(arg).substr(3));
      } else if (arg.size() > 1 && arg.front() == '-') {
        throw configuration_error("unknown option '" + arg + "'");
      } else if (positional == 0) {
        d.filename = arg;
        ++positional;
      } else if (positional == 1) {
        d.expected_errors = parse_count(arg);
        ++positional;
      } else {
        throw configuration_error("unexpected argument '" + arg + "'");
      }
    }

    if (d.filename.empty())
      throw configuration_error("directive has no filename");
    return d;
  }

} // namespace xt
