#include <xt/builtin_types.hpp>
#include <xt/schema.hpp>

#include <algorithm>
#include <cstdlib>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace xt {

  namespace {

    constexpr int max_derivation_depth = 32;
    constexpr int max_group_depth = 64;

    struct particle_match {
      const xml_element* child;
      const element_decl* decl;
      const wildcard* any;
    };

    std::vector<std::string>
    split_list(std::string_view value) {
      std::vector<std::string> items;
      std::string item;
      for (char c : value) {
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
          if (!item.empty()) items.push_back(std::move(item));
          item.clear();
        } else {
          item += c;
        }
      }
      if (!item.empty()) items.push_back(std::move(item));
      return items;
    }

    std::size_t
    utf8_length(std::string_view s) {
      return static_cast<std::size_t>(std::count_if(s.begin(), s.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
      }));
    }

    std::optional<double>
    to_number(const std::string& s) {
      if (s.empty()) return std::nullopt;
      char* end = nullptr;
      double v = std::strtod(s.c_str(), &end);
      if (end != s.c_str() + s.size()) return std::nullopt;
      return v;
    }

    // Negative, zero or positive like strcmp. Numeric when both sides are
    // numbers of a numeric type, lexical otherwise.
    int
    compare_values(const std::string& a, const std::string& b, bool numeric) {
      if (numeric) {
        auto x = to_number(a);
        auto y = to_number(b);
        if (x && y) return *x < *y ? -1 : (*x > *y ? 1 : 0);
      }
      return a.compare(b);
    }

    class instance_validator {
      const schema& schema_;
      std::vector<schema_error>& errors_;

    public:
      instance_validator(const schema& s, std::vector<schema_error>& errors)
          : schema_(s), errors_(errors) {}

      void
      validate_root(const xml_element& root) {
        const auto* decl = schema_.find_element(root.name());
        if (decl == nullptr) {
          error(root, "no global declaration for root element " +
                          root.name().str());
          return;
        }
        validate_element(root, *decl);
      }

    private:
      void
      error(const xml_element& at, std::string message) {
        errors_.push_back({std::move(message), at.line()});
      }

      // --- simple values ---------------------------------------------------

      // Built-in at the root of a derivation chain, or "" for lists and
      // unions.
      std::string
      primitive_of(const simple_type& st) const {
        const simple_type* current = &st;
        for (int depth = 0; depth < max_derivation_depth; ++depth) {
          if (current->variety() != simple_type_variety::atomic) return {};
          const auto& base = current->base();
          if (base.type == nullptr) {
            return base.name.is_xs() ? base.name.local_name() : std::string();
          }
          current = base.type;
        }
        return {};
      }

      bool
      is_list(const simple_type& st) const {
        const simple_type* current = &st;
        for (int depth = 0; depth < max_derivation_depth; ++depth) {
          if (current->variety() == simple_type_variety::list) return true;
          if (current->variety() == simple_type_variety::union_type)
            return false;
          if (current->base().type == nullptr) return false;
          current = current->base().type;
        }
        return false;
      }

      std::optional<std::string>
      check_ref(const simple_type_ref& ref, std::string_view raw,
                int depth) const {
        if (ref.type != nullptr) return check_type(*ref.type, raw, depth + 1);
        if (ref.name.is_xs() && !ref.name.is_xs("anyType")) {
          const auto& local = ref.name.local_name();
          return check_builtin_value(local,
                                     normalize_builtin_value(local, raw));
        }
        // Absent or unresolved (already reported against the schema)
        return std::nullopt;
      }

      std::optional<std::string>
      check_facets(const facet_set& facets, const std::string& value,
                   std::size_t length, const std::string& primitive) const {
        if (!facets.enumeration.empty() &&
            std::find(facets.enumeration.begin(), facets.enumeration.end(),
                      value) == facets.enumeration.end()) {
          return "'" + value + "' is not one of the enumerated values";
        }
        if (facets.length && length != *facets.length)
          return "length of '" + value + "' is not " +
                 std::to_string(*facets.length);
        if (facets.min_length && length < *facets.min_length)
          return "'" + value + "' is shorter than " +
                 std::to_string(*facets.min_length);
        if (facets.max_length && length > *facets.max_length)
          return "'" + value + "' is longer than " +
                 std::to_string(*facets.max_length);

        bool numeric = is_numeric_builtin(primitive);
        if (facets.min_inclusive &&
            compare_values(value, *facets.min_inclusive, numeric) < 0)
          return "'" + value + "' is less than " + *facets.min_inclusive;
        if (facets.max_inclusive &&
            compare_values(value, *facets.max_inclusive, numeric) > 0)
          return "'" + value + "' is greater than " + *facets.max_inclusive;
        if (facets.min_exclusive &&
            compare_values(value, *facets.min_exclusive, numeric) <= 0)
          return "'" + value + "' is not greater than " +
                 *facets.min_exclusive;
        if (facets.max_exclusive &&
            compare_values(value, *facets.max_exclusive, numeric) >= 0)
          return "'" + value + "' is not less than " + *facets.max_exclusive;
        return std::nullopt;
      }

      std::optional<std::string>
      check_type(const simple_type& st, std::string_view raw,
                 int depth) const {
        if (depth > max_derivation_depth)
          return std::string("simple type derivation is circular");

        switch (st.variety()) {
          case simple_type_variety::union_type: {
            for (const auto& member : st.members()) {
              if (!check_ref(member, raw, depth)) return std::nullopt;
            }
            return "'" + std::string(raw) +
                   "' does not match any member type of the union";
          }
          case simple_type_variety::list: {
            auto items = split_list(raw);
            for (const auto& item : items) {
              if (auto reason = check_ref(st.base(), item, depth)) return reason;
            }
            return check_facets(st.facets(),
                                normalize_builtin_value("token", raw),
                                items.size(), "");
          }
          case simple_type_variety::atomic:
            break;
        }

        if (auto reason = check_ref(st.base(), raw, depth)) return reason;
        if (st.facets().empty()) return std::nullopt;

        if (is_list(st)) {
          return check_facets(st.facets(),
                              normalize_builtin_value("token", raw),
                              split_list(raw).size(), "");
        }
        auto primitive = primitive_of(st);
        auto value = normalize_builtin_value(
            primitive.empty() ? "string" : primitive, raw);
        return check_facets(st.facets(), value, utf8_length(value), primitive);
      }

      std::optional<std::string>
      check_element_value(const type_ref& type, std::string_view raw) const {
        if (type.simple != nullptr) return check_type(*type.simple, raw, 0);
        if (type.is_builtin_simple()) {
          const auto& local = type.name.local_name();
          return check_builtin_value(local,
                                     normalize_builtin_value(local, raw));
        }
        return std::nullopt;
      }

      // --- attributes ------------------------------------------------------

      struct attribute_scope {
        std::map<qname, const attribute_decl*> declared;
        const wildcard* any = nullptr;
      };

      void
      collect_uses(const attribute_uses& uses, attribute_scope& scope,
                   int depth) const {
        if (depth > max_group_depth) return;
        for (const auto& attr : uses.attributes)
          scope.declared[attr->instance_name()] = attr.get();
        for (const auto& group : uses.group_refs) {
          if (const auto* def = group->definition())
            collect_uses(def->uses(), scope, depth + 1);
        }
        if (uses.any_attribute) scope.any = uses.any_attribute.get();
      }

      std::vector<const complex_type*>
      derivation_chain(const complex_type& ct) const {
        std::vector<const complex_type*> chain;
        for (const complex_type* c = &ct;
             c != nullptr && chain.size() < max_derivation_depth;
             c = c->base_complex()) {
          chain.push_back(c);
        }
        std::reverse(chain.begin(), chain.end());
        return chain;
      }

      void
      validate_attributes(const xml_element& e, const complex_type& ct) {
        attribute_scope scope;
        for (const auto* c : derivation_chain(ct))
          collect_uses(c->attributes(), scope, 0);

        for (const auto& attr : e.attributes()) {
          if (attr.name.namespace_uri() == xsi_namespace) continue;
          auto it = scope.declared.find(attr.name);
          if (it == scope.declared.end() ||
              it->second->use() == attribute_use::prohibited) {
            if (scope.any != nullptr &&
                scope.any->allows(attr.name.namespace_uri())) {
              check_wildcard_attribute(e, attr, *scope.any);
              continue;
            }
            error(e, "unexpected attribute '" + attr.name.str() + "' on <" +
                         e.name().local_name() + ">");
            continue;
          }
          check_attribute_value(e, attr, it->second->effective());
        }

        for (const auto& [name, decl] : scope.declared) {
          if (decl->use() != attribute_use::required) continue;
          if (!e.attribute(name)) {
            error(e, "missing required attribute '" + name.str() + "' on <" +
                         e.name().local_name() + ">");
          }
        }
      }

      void
      check_attribute_value(const xml_element& e, const xml_attribute& attr,
                            const attribute_decl& decl) {
        if (auto reason = check_ref(decl.type(), attr.value, 0)) {
          error(e, "invalid value for attribute '" + attr.name.str() +
                       "': " + *reason);
          return;
        }
        if (decl.fixed_value() && attr.value != *decl.fixed_value()) {
          error(e, "attribute '" + attr.name.str() + "' must have the value '" +
                       *decl.fixed_value() + "'");
        }
      }

      void
      check_wildcard_attribute(const xml_element& e, const xml_attribute& attr,
                               const wildcard& any) {
        if (any.process() == process_contents::skip) return;
        const auto* decl = schema_.find_attribute(attr.name);
        if (decl != nullptr) {
          check_attribute_value(e, attr, *decl);
        } else if (any.process() == process_contents::strict) {
          error(e, "no declaration for attribute '" + attr.name.str() + "'");
        }
      }

      // --- content models --------------------------------------------------

      using children_type = std::vector<xml_element>;

      std::optional<std::size_t>
      match_particle(const schema_component& p, const children_type& children,
                     std::size_t pos, std::vector<particle_match>& matches,
                     int depth) const {
        switch (p.kind()) {
          case component_kind::element: {
            const auto& decl = static_cast<const element_decl&>(p);
            const auto& occurs = decl.occurs();
            std::size_t count = 0;
            while (occurs.admits_another(count) && pos < children.size() &&
                   children[pos].name() == decl.instance_name()) {
              matches.push_back({&children[pos], &decl, nullptr});
              ++pos;
              ++count;
            }
            if (!occurs.satisfied_by(count)) return std::nullopt;
            return pos;
          }
          case component_kind::any_element: {
            const auto& any = static_cast<const wildcard&>(p);
            const auto& occurs = any.occurs();
            std::size_t count = 0;
            while (occurs.admits_another(count) && pos < children.size() &&
                   any.allows(children[pos].name().namespace_uri())) {
              matches.push_back({&children[pos], nullptr, &any});
              ++pos;
              ++count;
            }
            if (!occurs.satisfied_by(count)) return std::nullopt;
            return pos;
          }
          case component_kind::model_group:
            return match_group(static_cast<const model_group&>(p), children,
                               pos, matches, depth + 1);
          default:
            return pos;
        }
      }

      std::optional<std::size_t>
      match_once(const model_group& def, const children_type& children,
                 std::size_t pos, std::vector<particle_match>& matches,
                 int depth) const {
        switch (def.compositor()) {
          case compositor_kind::sequence:
            for (const auto& p : def.particles()) {
              auto r = match_particle(*p, children, pos, matches, depth);
              if (!r) return std::nullopt;
              pos = *r;
            }
            return pos;

          case compositor_kind::choice: {
            bool emptiable = false;
            for (const auto& p : def.particles()) {
              auto mark = matches.size();
              auto r = match_particle(*p, children, pos, matches, depth);
              if (r && *r > pos) return r;
              matches.resize(mark);
              if (r) emptiable = true;
            }
            if (emptiable) return pos;
            return std::nullopt;
          }

          case compositor_kind::all: {
            const auto& particles = def.particles();
            std::vector<std::size_t> counts(particles.size(), 0);
            while (pos < children.size()) {
              bool found = false;
              for (std::size_t i = 0; i < particles.size() && !found; ++i) {
                const auto& p = *particles[i];
                if (p.kind() == component_kind::element) {
                  const auto& decl = static_cast<const element_decl&>(p);
                  if (decl.occurs().admits_another(counts[i]) &&
                      children[pos].name() == decl.instance_name()) {
                    matches.push_back({&children[pos], &decl, nullptr});
                    found = true;
                  }
                } else if (p.kind() == component_kind::any_element) {
                  const auto& any = static_cast<const wildcard&>(p);
                  if (any.occurs().admits_another(counts[i]) &&
                      any.allows(children[pos].name().namespace_uri())) {
                    matches.push_back({&children[pos], nullptr, &any});
                    found = true;
                  }
                }
                if (found) ++counts[i];
              }
              if (!found) break;
              ++pos;
            }
            for (std::size_t i = 0; i < particles.size(); ++i) {
              const auto& p = *particles[i];
              const occurrence* occurs = nullptr;
              if (p.kind() == component_kind::element)
                occurs = &static_cast<const element_decl&>(p).occurs();
              else if (p.kind() == component_kind::any_element)
                occurs = &static_cast<const wildcard&>(p).occurs();
              if (occurs && !occurs->satisfied_by(counts[i]))
                return std::nullopt;
            }
            return pos;
          }
        }
        return std::nullopt;
      }

      std::optional<std::size_t>
      match_group(const model_group& group, const children_type& children,
                  std::size_t pos, std::vector<particle_match>& matches,
                  int depth) const {
        if (depth > max_group_depth) return std::nullopt;
        const model_group* def = group.definition();
        if (def == nullptr) return pos;

        const auto& occurs = group.occurs();
        std::size_t count = 0;
        while (occurs.admits_another(count)) {
          auto mark = matches.size();
          auto r = match_once(*def, children, pos, matches, depth);
          if (!r) {
            matches.resize(mark);
            break;
          }
          if (*r == pos) {
            // Matched without consuming: the remaining repetitions can all
            // be empty too.
            count = std::max(count, occurs.min_occurs);
            break;
          }
          pos = *r;
          ++count;
        }
        if (!occurs.satisfied_by(count)) return std::nullopt;
        return pos;
      }

      // --- elements --------------------------------------------------------

      void
      validate_complex(const xml_element& e, const complex_type& ct) {
        validate_attributes(e, ct);

        if (ct.simple_content()) {
          if (!e.children().empty()) {
            error(e.children().front(),
                  "element <" + e.name().local_name() +
                      "> has simple content and cannot have child elements");
            return;
          }
          for (const auto* c : derivation_chain(ct)) {
            if (c->base_simple().empty()) continue;
            if (auto reason = check_ref(c->base_simple(), e.text(), 0))
              error(e, "invalid value for <" + e.name().local_name() +
                           ">: " + *reason);
            break;
          }
          return;
        }

        // Extension appends the derived content to the base content
        std::vector<const model_group*> parts;
        bool mixed = ct.mixed();
        for (const complex_type* c = &ct;
             c != nullptr && parts.size() < max_derivation_depth;
             c = c->base_complex()) {
          if (c->content()) parts.push_back(c->content().get());
          if (c->derivation() != derivation_method::extension) break;
        }
        std::reverse(parts.begin(), parts.end());

        if (!mixed && e.has_text()) {
          error(e, "character data is not allowed in the element-only "
                   "content of <" +
                       e.name().local_name() + ">");
        }

        const auto& children = e.children();
        std::vector<particle_match> matches;
        std::size_t pos = 0;
        bool complete = true;
        for (const auto* part : parts) {
          auto r = match_group(*part, children, pos, matches, 0);
          if (!r) {
            complete = false;
            break;
          }
          pos = *r;
        }

        if (pos < children.size()) {
          error(children[pos], "unexpected child element <" +
                                   children[pos].name().local_name() +
                                   "> in <" + e.name().local_name() + ">");
        } else if (!complete) {
          error(e, "content of <" + e.name().local_name() + "> is incomplete");
        }

        for (const auto& m : matches) {
          if (m.decl != nullptr) {
            validate_element(*m.child, *m.decl);
            continue;
          }
          if (m.any->process() == process_contents::skip) continue;
          const auto* decl = schema_.find_element(m.child->name());
          if (decl != nullptr) {
            validate_element(*m.child, *decl);
          } else if (m.any->process() == process_contents::strict) {
            error(*m.child, "no declaration for element " +
                                m.child->name().str());
          }
        }
      }

      void
      validate_element(const xml_element& e, const element_decl& particle) {
        const auto& decl = particle.effective();

        auto nil = e.attribute(qname{xsi_namespace, "nil"});
        if (nil && (*nil == "true" || *nil == "1")) {
          if (!decl.nillable()) {
            error(e, "element <" + e.name().local_name() + "> is not nillable");
          } else {
            if (!e.children().empty() || e.has_text())
              error(e, "nil element <" + e.name().local_name() +
                           "> must be empty");
            return;
          }
        }

        const auto& type = decl.type();
        if (type.complex != nullptr) {
          validate_complex(e, *type.complex);
          return;
        }
        if (type.is_any_type()) return;

        for (const auto& attr : e.attributes()) {
          if (attr.name.namespace_uri() == xsi_namespace) continue;
          error(e, "unexpected attribute '" + attr.name.str() + "' on <" +
                       e.name().local_name() + ">");
        }
        if (!e.children().empty()) {
          error(e.children().front(),
                "element <" + e.name().local_name() +
                    "> has a simple type and cannot have child elements");
          return;
        }

        std::string value = e.text();
        if (value.empty() && decl.default_value()) value = *decl.default_value();
        if (value.empty() && decl.fixed_value()) value = *decl.fixed_value();
        if (auto reason = check_element_value(type, value)) {
          error(e, "invalid value for <" + e.name().local_name() + ">: " +
                       *reason);
          return;
        }
        if (decl.fixed_value() && value != *decl.fixed_value()) {
          error(e, "element <" + e.name().local_name() +
                       "> must have the value '" + *decl.fixed_value() + "'");
        }
      }
    };

  } // namespace

  std::vector<schema_error>
  schema::validate(const xml_element& document) const {
    std::vector<schema_error> errors;
    instance_validator validator(*this, errors);
    validator.validate_root(document);
    return errors;
  }

} // namespace xt
