#pragma once

#include <compare>
#include <functional>
#include <ostream>
#include <string>

namespace xt {

  inline const std::string xs_namespace = "http://www.w3.org/2001/XMLSchema";
  inline const std::string xsi_namespace =
      "http://www.w3.org/2001/XMLSchema-instance";

  class qname {
    std::string namespace_uri_;
    std::string local_name_;

  public:
    qname() = default;

    explicit qname(std::string local_name)
        : local_name_(std::move(local_name)) {}

    qname(std::string namespace_uri, std::string local_name)
        : namespace_uri_(std::move(namespace_uri)),
          local_name_(std::move(local_name)) {}

    const std::string&
    namespace_uri() const {
      return namespace_uri_;
    }

    const std::string&
    local_name() const {
      return local_name_;
    }

    bool
    empty() const {
      return local_name_.empty();
    }

    // True for names in the XML Schema namespace (xs:element, xs:string...).
    bool
    is_xs() const {
      return namespace_uri_ == xs_namespace;
    }

    bool
    is_xs(const std::string& local) const {
      return is_xs() && local_name_ == local;
    }

    // Clark notation, "{uri}local", or just "local" when unqualified.
    std::string
    str() const {
      if (namespace_uri_.empty()) return local_name_;
      return '{' + namespace_uri_ + '}' + local_name_;
    }

    auto
    operator<=>(const qname&) const = default;

    bool
    operator==(const qname&) const = default;

    friend std::ostream&
    operator<<(std::ostream& os, const qname& q) {
      return os << q.str();
    }
  };

} // namespace xt

template <>
struct std::hash<xt::qname> {
  std::size_t
  operator()(const xt::qname& q) const noexcept {
    std::size_t h1 = std::hash<std::string>{}(q.namespace_uri());
    std::size_t h2 = std::hash<std::string>{}(q.local_name());
    return h1 ^ (h2 << 1);
  }
};
