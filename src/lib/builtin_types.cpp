#include <xt/builtin_types.hpp>

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <unordered_set>

namespace xt {

  namespace {

    const std::unordered_set<std::string_view>&
    builtin_names() {
      static const std::unordered_set<std::string_view> names = {
          "anyType",          "anySimpleType",      "string",
          "normalizedString", "token",              "language",
          "Name",             "NCName",             "ID",
          "IDREF",            "IDREFS",             "ENTITY",
          "ENTITIES",         "NMTOKEN",            "NMTOKENS",
          "NOTATION",         "QName",              "anyURI",
          "boolean",          "decimal",            "integer",
          "nonPositiveInteger", "negativeInteger",  "long",
          "int",              "short",              "byte",
          "nonNegativeInteger", "unsignedLong",     "unsignedInt",
          "unsignedShort",    "unsignedByte",       "positiveInteger",
          "float",            "double",             "duration",
          "dateTime",         "time",               "date",
          "gYearMonth",       "gYear",              "gMonthDay",
          "gDay",             "gMonth",             "hexBinary",
          "base64Binary",
      };
      return names;
    }

    const std::unordered_set<std::string_view>&
    builtin_names_1_1() {
      static const std::unordered_set<std::string_view> names = {
          "anyAtomicType", "dateTimeStamp", "yearMonthDuration",
          "dayTimeDuration"};
      return names;
    }

    bool
    is_digit(char c) {
      return c >= '0' && c <= '9';
    }

    bool
    all_digits(std::string_view s) {
      return !s.empty() && std::all_of(s.begin(), s.end(), is_digit);
    }

    bool
    is_name_start(char c) {
      return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || c == '_' ||
             static_cast<unsigned char>(c) >= 0x80;
    }

    bool
    is_name_char(char c) {
      return is_name_start(c) || is_digit(c) || c == '-' || c == '.';
    }

    bool
    is_ncname(std::string_view s) {
      if (s.empty() || !is_name_start(s[0])) return false;
      return std::all_of(s.begin() + 1, s.end(), is_name_char);
    }

    bool
    is_name(std::string_view s) {
      if (s.empty() || !(is_name_start(s[0]) || s[0] == ':')) return false;
      return std::all_of(s.begin() + 1, s.end(),
                         [](char c) { return is_name_char(c) || c == ':'; });
    }

    bool
    is_nmtoken(std::string_view s) {
      return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) {
        return is_name_char(c) || c == ':';
      });
    }

    template <typename Pred>
    bool
    all_tokens(std::string_view s, Pred pred) {
      bool any = false;
      std::size_t pos = 0;
      while (pos < s.size()) {
        auto end = s.find(' ', pos);
        if (end == std::string_view::npos) end = s.size();
        if (!pred(s.substr(pos, end - pos))) return false;
        any = true;
        pos = end + 1;
      }
      return any;
    }

    struct integer_value {
      bool negative = false;
      bool zero = false;
    };

    std::optional<integer_value>
    parse_integer(std::string_view s) {
      integer_value v;
      if (!s.empty() && (s[0] == '+' || s[0] == '-')) {
        v.negative = s[0] == '-';
        s.remove_prefix(1);
      }
      if (!all_digits(s)) return std::nullopt;
      v.zero = std::all_of(s.begin(), s.end(), [](char c) { return c == '0'; });
      return v;
    }

    template <typename T>
    bool
    in_range(std::string_view s, T lo, T hi) {
      if (!s.empty() && s[0] == '+') s.remove_prefix(1);
      T value{};
      auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
      if (ec != std::errc() || ptr != s.data() + s.size()) return false;
      return value >= lo && value <= hi;
    }

    bool
    is_unsigned_in_range(std::string_view s, std::uint64_t hi) {
      auto v = parse_integer(s);
      if (!v) return false;
      if (v->negative) return v->zero;
      return in_range<std::uint64_t>(s, 0, hi);
    }

    bool
    is_decimal(std::string_view s) {
      if (!s.empty() && (s[0] == '+' || s[0] == '-')) s.remove_prefix(1);
      auto dot = s.find('.');
      if (dot == std::string_view::npos) return all_digits(s);
      auto whole = s.substr(0, dot);
      auto frac = s.substr(dot + 1);
      if (whole.empty() && frac.empty()) return false;
      return (whole.empty() || all_digits(whole)) &&
             (frac.empty() || all_digits(frac));
    }

    bool
    is_floating(std::string_view s) {
      if (s == "INF" || s == "-INF" || s == "+INF" || s == "NaN") return true;
      auto e = s.find_first_of("eE");
      if (e == std::string_view::npos) return is_decimal(s);
      auto exponent = s.substr(e + 1);
      if (!exponent.empty() && (exponent[0] == '+' || exponent[0] == '-'))
        exponent.remove_prefix(1);
      return is_decimal(s.substr(0, e)) && all_digits(exponent);
    }

    // Strips an optional timezone ("Z", "+hh:mm", "-hh:mm") and reports
    // whether one was present.
    bool
    strip_timezone(std::string_view& s, bool& has_timezone) {
      has_timezone = false;
      if (!s.empty() && s.back() == 'Z') {
        s.remove_suffix(1);
        has_timezone = true;
        return true;
      }
      if (s.size() >= 6) {
        auto tz = s.substr(s.size() - 6);
        if ((tz[0] == '+' || tz[0] == '-') && all_digits(tz.substr(1, 2)) &&
            tz[3] == ':' && all_digits(tz.substr(4, 2))) {
          s.remove_suffix(6);
          has_timezone = true;
        }
      }
      return true;
    }

    bool
    two_digits_between(std::string_view s, int lo, int hi) {
      if (s.size() != 2 || !all_digits(s)) return false;
      int v = (s[0] - '0') * 10 + (s[1] - '0');
      return v >= lo && v <= hi;
    }

    bool
    is_year(std::string_view s) {
      if (!s.empty() && s[0] == '-') s.remove_prefix(1);
      return s.size() >= 4 && all_digits(s);
    }

    bool
    is_date_part(std::string_view s) {
      if (s.size() < 10) return false;
      auto year = s.substr(0, s.size() - 6);
      auto rest = s.substr(s.size() - 6);
      return is_year(year) && rest[0] == '-' &&
             two_digits_between(rest.substr(1, 2), 1, 12) && rest[3] == '-' &&
             two_digits_between(rest.substr(4, 2), 1, 31);
    }

    bool
    is_time_part(std::string_view s) {
      if (s.size() < 8) return false;
      if (!two_digits_between(s.substr(0, 2), 0, 24) || s[2] != ':' ||
          !two_digits_between(s.substr(3, 2), 0, 59) || s[5] != ':' ||
          !two_digits_between(s.substr(6, 2), 0, 60))
        return false;
      auto frac = s.substr(8);
      if (frac.empty()) return true;
      return frac[0] == '.' && all_digits(frac.substr(1));
    }

    bool
    is_duration(std::string_view s) {
      if (!s.empty() && s[0] == '-') s.remove_prefix(1);
      if (s.size() < 3 || s[0] != 'P') return false;
      s.remove_prefix(1);
      bool in_time = false;
      bool digits_seen = false;
      bool component_seen = false;
      for (char c : s) {
        if (is_digit(c) || c == '.') {
          digits_seen = true;
        } else if (c == 'T') {
          if (in_time || digits_seen) return false;
          in_time = true;
        } else if (std::string_view("YMDHS").find(c) != std::string_view::npos) {
          if (!digits_seen) return false;
          if (!in_time && (c == 'H' || c == 'S')) return false;
          if (in_time && (c == 'Y' || c == 'D')) return false;
          digits_seen = false;
          component_seen = true;
        } else {
          return false;
        }
      }
      return component_seen && !digits_seen;
    }

    bool
    is_hex_binary(std::string_view s) {
      return s.size() % 2 == 0 && std::all_of(s.begin(), s.end(), [](char c) {
               return is_digit(c) || (c >= 'a' && c <= 'f') ||
                      (c >= 'A' && c <= 'F');
             });
    }

    bool
    is_base64(std::string_view s) {
      std::size_t count = 0;
      for (char c : s) {
        if (c == ' ') continue;
        bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                  is_digit(c) || c == '+' || c == '/' || c == '=';
        if (!ok) return false;
        ++count;
      }
      return count % 4 == 0;
    }

    std::string
    collapse(std::string_view value) {
      std::string result;
      bool pending_space = false;
      for (char c : value) {
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
          pending_space = !result.empty();
          continue;
        }
        if (pending_space) result += ' ';
        pending_space = false;
        result += c;
      }
      return result;
    }

  } // namespace

  bool
  is_builtin_type(std::string_view local, schema_version version) {
    if (builtin_names().count(local)) return true;
    return version == schema_version::v1_1 &&
           builtin_names_1_1().count(local) != 0;
  }

  std::string
  normalize_builtin_value(std::string_view type, std::string_view value) {
    if (type == "string" || type == "anySimpleType") return std::string(value);
    if (type == "normalizedString") {
      std::string result(value);
      std::replace_if(
          result.begin(), result.end(),
          [](char c) { return c == '\t' || c == '\n' || c == '\r'; }, ' ');
      return result;
    }
    return collapse(value);
  }

  bool
  is_numeric_builtin(std::string_view type) {
    static const std::unordered_set<std::string_view> numeric = {
        "decimal",          "integer",           "nonPositiveInteger",
        "negativeInteger",  "long",              "int",
        "short",            "byte",              "nonNegativeInteger",
        "unsignedLong",     "unsignedInt",       "unsignedShort",
        "unsignedByte",     "positiveInteger",   "float",
        "double"};
    return numeric.count(type) != 0;
  }

  std::optional<std::string>
  check_builtin_value(std::string_view type, std::string_view value) {
    auto invalid = [&]() -> std::optional<std::string> {
      return "'" + std::string(value) + "' is not a valid xs:" +
             std::string(type);
    };

    if (type == "boolean") {
      if (value == "true" || value == "false" || value == "1" || value == "0")
        return std::nullopt;
      return invalid();
    }
    if (type == "decimal") return is_decimal(value) ? std::nullopt : invalid();
    if (type == "float" || type == "double")
      return is_floating(value) ? std::nullopt : invalid();

    if (type == "integer" || type == "nonPositiveInteger" ||
        type == "negativeInteger" || type == "nonNegativeInteger" ||
        type == "positiveInteger") {
      auto v = parse_integer(value);
      if (!v) return invalid();
      if (type == "nonPositiveInteger" && !v->negative && !v->zero)
        return invalid();
      if (type == "negativeInteger" && (!v->negative || v->zero))
        return invalid();
      if (type == "nonNegativeInteger" && v->negative && !v->zero)
        return invalid();
      if (type == "positiveInteger" && (v->negative || v->zero))
        return invalid();
      return std::nullopt;
    }
    if (type == "long")
      return in_range<std::int64_t>(value, INT64_MIN, INT64_MAX)
                 ? std::nullopt
                 : invalid();
    if (type == "int")
      return in_range<std::int64_t>(value, INT32_MIN, INT32_MAX)
                 ? std::nullopt
                 : invalid();
    if (type == "short")
      return in_range<std::int64_t>(value, INT16_MIN, INT16_MAX)
                 ? std::nullopt
                 : invalid();
    if (type == "byte")
      return in_range<std::int64_t>(value, INT8_MIN, INT8_MAX) ? std::nullopt
                                                               : invalid();
    if (type == "unsignedLong")
      return is_unsigned_in_range(value, UINT64_MAX) ? std::nullopt
                                                     : invalid();
    if (type == "unsignedInt")
      return is_unsigned_in_range(value, UINT32_MAX) ? std::nullopt
                                                     : invalid();
    if (type == "unsignedShort")
      return is_unsigned_in_range(value, UINT16_MAX) ? std::nullopt
                                                     : invalid();
    if (type == "unsignedByte")
      return is_unsigned_in_range(value, UINT8_MAX) ? std::nullopt
                                                    : invalid();

    if (type == "date") {
      std::string_view s = value;
      bool tz = false;
      strip_timezone(s, tz);
      return is_date_part(s) ? std::nullopt : invalid();
    }
    if (type == "dateTime" || type == "dateTimeStamp") {
      std::string_view s = value;
      bool tz = false;
      strip_timezone(s, tz);
      auto t = s.find('T');
      if (t == std::string_view::npos || !is_date_part(s.substr(0, t)) ||
          !is_time_part(s.substr(t + 1)))
        return invalid();
      if (type == "dateTimeStamp" && !tz) return invalid();
      return std::nullopt;
    }
    if (type == "time") {
      std::string_view s = value;
      bool tz = false;
      strip_timezone(s, tz);
      return is_time_part(s) ? std::nullopt : invalid();
    }
    if (type == "gYear") {
      std::string_view s = value;
      bool tz = false;
      strip_timezone(s, tz);
      return is_year(s) ? std::nullopt : invalid();
    }
    if (type == "duration") return is_duration(value) ? std::nullopt : invalid();
    if (type == "yearMonthDuration") {
      if (!is_duration(value) ||
          value.find_first_of("DTHS") != std::string_view::npos)
        return invalid();
      return std::nullopt;
    }
    if (type == "dayTimeDuration") {
      auto t = value.find('T');
      auto ym = value.substr(0, t == std::string_view::npos ? value.size() : t);
      if (!is_duration(value) ||
          ym.find_first_of("YM") != std::string_view::npos)
        return invalid();
      return std::nullopt;
    }

    if (type == "hexBinary")
      return is_hex_binary(value) ? std::nullopt : invalid();
    if (type == "base64Binary")
      return is_base64(value) ? std::nullopt : invalid();

    if (type == "NCName" || type == "ID" || type == "IDREF" ||
        type == "ENTITY")
      return is_ncname(value) ? std::nullopt : invalid();
    if (type == "Name") return is_name(value) ? std::nullopt : invalid();
    if (type == "NMTOKEN") return is_nmtoken(value) ? std::nullopt : invalid();
    if (type == "IDREFS" || type == "ENTITIES")
      return all_tokens(value, is_ncname) ? std::nullopt : invalid();
    if (type == "NMTOKENS")
      return all_tokens(value, is_nmtoken) ? std::nullopt : invalid();
    if (type == "QName" || type == "NOTATION") {
      auto colon = value.find(':');
      if (colon == std::string_view::npos)
        return is_ncname(value) ? std::nullopt : invalid();
      return is_ncname(value.substr(0, colon)) &&
                     is_ncname(value.substr(colon + 1))
                 ? std::nullopt
                 : invalid();
    }
    if (type == "language") {
      if (value.empty() || value.size() > 64) return invalid();
      return std::all_of(value.begin(), value.end(),
                         [](char c) {
                           return (c >= 'a' && c <= 'z') ||
                                  (c >= 'A' && c <= 'Z') || is_digit(c) ||
                                  c == '-';
                         })
                 ? std::nullopt
                 : invalid();
    }

    // string, normalizedString, token, anyURI, anySimpleType and the
    // calendar fragments accept any lexical value here.
    return std::nullopt;
  }

} // namespace xt
