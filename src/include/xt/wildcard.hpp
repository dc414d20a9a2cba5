#pragma once

#include <xt/occurrence.hpp>
#include <xt/schema_component.hpp>

#include <string>
#include <vector>

namespace xt {

  // xs:any and xs:anyAttribute. The namespace constraint keeps the raw
  // tokens of the `namespace` attribute ("##any", "##other", "##local",
  // "##targetNamespace" or URIs).
  class wildcard : public schema_component {
    std::vector<std::string> namespaces_{"##any"};
    std::string target_namespace_;
    process_contents process_ = process_contents::strict;
    occurrence occurs_;

  public:
    wildcard(component_kind kind, std::size_t line)
        : schema_component(kind, qname{}, line) {}

    const std::vector<std::string>&
    namespaces() const {
      return namespaces_;
    }

    void
    set_namespaces(std::vector<std::string> namespaces,
                   std::string target_namespace) {
      namespaces_ = std::move(namespaces);
      target_namespace_ = std::move(target_namespace);
    }

    process_contents
    process() const {
      return process_;
    }

    void
    set_process(process_contents p) {
      process_ = p;
    }

    const occurrence&
    occurs() const {
      return occurs_;
    }

    void
    set_occurs(occurrence o) {
      occurs_ = o;
    }

    bool
    allows(const std::string& namespace_uri) const {
      for (const auto& token : namespaces_) {
        if (token == "##any") return true;
        if (token == "##other") {
          if (!namespace_uri.empty() && namespace_uri != target_namespace_)
            return true;
        } else if (token == "##local") {
          if (namespace_uri.empty()) return true;
        } else if (token == "##targetNamespace") {
          if (namespace_uri == target_namespace_) return true;
        } else if (token == namespace_uri) {
          return true;
        }
      }
      return false;
    }
  };

} // namespace xt
