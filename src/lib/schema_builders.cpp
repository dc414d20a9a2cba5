#include <xt/attribute_decl.hpp>
#include <xt/attribute_group.hpp>
#include <xt/complex_type.hpp>
#include <xt/element_decl.hpp>
#include <xt/model_group.hpp>
#include <xt/schema.hpp>
#include <xt/schema_builders.hpp>
#include <xt/simple_type.hpp>
#include <xt/wildcard.hpp>

#include <charconv>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace xt {

  namespace {

    bool
    is_annotation(const xml_element& child) {
      return child.name().is_xs("annotation");
    }

    void
    unexpected_child(const xml_element& child, const xml_element& parent,
                     build_context& ctx) {
      ctx.error(child, "unexpected <" + child.name().local_name() +
                           "> in <" + parent.name().local_name() + ">");
    }

    std::optional<std::size_t>
    parse_count(const std::string& text) {
      std::size_t value = 0;
      auto [ptr, ec] =
          std::from_chars(text.data(), text.data() + text.size(), value);
      if (ec != std::errc() || ptr != text.data() + text.size())
        return std::nullopt;
      return value;
    }

    // Parses minOccurs/maxOccurs. Particles at the top level of a schema
    // must not carry them.
    occurrence
    parse_occurrence(const xml_element& elem, build_context& ctx) {
      occurrence o;
      auto min_str = elem.attribute("minOccurs");
      auto max_str = elem.attribute("maxOccurs");
      if ((min_str || max_str) && ctx.top_level()) {
        ctx.error(elem, "minOccurs/maxOccurs not allowed on a global <" +
                            elem.name().local_name() + ">");
        return o;
      }
      if (min_str) {
        auto v = parse_count(*min_str);
        if (v)
          o.min_occurs = *v;
        else
          ctx.error(elem, "invalid minOccurs '" + *min_str + "'");
      }
      if (max_str) {
        if (*max_str == "unbounded") {
          o.max_occurs = unbounded;
        } else if (auto v = parse_count(*max_str)) {
          o.max_occurs = *v;
        } else {
          ctx.error(elem, "invalid maxOccurs '" + *max_str + "'");
        }
      }
      if (o.min_occurs > o.max_occurs) {
        ctx.error(elem, "minOccurs is greater than maxOccurs");
        o.max_occurs = o.min_occurs;
      }
      return o;
    }

    // QName-valued attribute (type, ref, base...). Reports unbound prefixes.
    std::optional<qname>
    qname_attr(const xml_element& elem, std::string_view local,
               build_context& ctx) {
      auto value = elem.attribute(local);
      if (!value) return std::nullopt;
      auto resolved = elem.resolve_qname(*value);
      if (!resolved) {
        ctx.error(elem, "unbound namespace prefix in " + std::string(local) +
                            "='" + *value + "'");
      }
      return resolved;
    }

    qname
    declared_name(const xml_element& elem, build_context& ctx,
                  bool qualified) {
      auto name = elem.attribute("name");
      if (!name) return {};
      if (ctx.top_level() || qualified)
        return qname{ctx.target_namespace(), *name};
      return qname{"", *name};
    }

    void
    require_name(const xml_element& elem, const qname& name,
                 build_context& ctx) {
      if (ctx.top_level() && name.empty())
        ctx.error(elem, "global <" + elem.name().local_name() +
                            "> requires a 'name' attribute");
    }

    // --- simple types ------------------------------------------------------

    void
    parse_facet(const xml_element& facet, facet_set& facets,
                build_context& ctx) {
      const auto& local = facet.name().local_name();
      auto value = facet.attribute("value");
      if (!value) {
        ctx.error(facet, "facet <" + local + "> requires a 'value' attribute");
        return;
      }

      auto count = [&](std::optional<std::size_t>& target) {
        auto v = parse_count(*value);
        if (v)
          target = *v;
        else
          ctx.error(facet, "invalid " + local + " value '" + *value + "'");
      };

      if (local == "enumeration") {
        facets.enumeration.push_back(*value);
      } else if (local == "pattern") {
        facets.patterns.push_back(*value);
      } else if (local == "minInclusive") {
        facets.min_inclusive = value;
      } else if (local == "maxInclusive") {
        facets.max_inclusive = value;
      } else if (local == "minExclusive") {
        facets.min_exclusive = value;
      } else if (local == "maxExclusive") {
        facets.max_exclusive = value;
      } else if (local == "length") {
        count(facets.length);
      } else if (local == "minLength") {
        count(facets.min_length);
      } else if (local == "maxLength") {
        count(facets.max_length);
      } else if (local == "whiteSpace" || local == "totalDigits" ||
                 local == "fractionDigits") {
        // Accepted, not enforced.
      } else if ((local == "assertion" || local == "explicitTimezone") &&
                 ctx.version() == schema_version::v1_1) {
        // XSD 1.1 facets, accepted, not enforced.
      } else {
        ctx.error(facet, "unknown facet <" + local + ">");
      }
    }

    simple_type_ref
    inline_simple_type(const xml_element& child, build_context& ctx) {
      simple_type_ref ref;
      ref.inline_type = ctx.build_as<simple_type>(simple_type_builder_key,
                                                  child);
      return ref;
    }

    std::shared_ptr<schema_component>
    build_simple_type(const xml_element& elem, build_context& ctx) {
      auto name = declared_name(elem, ctx, true);
      require_name(elem, name, ctx);
      auto st = std::make_shared<simple_type>(name, elem.line());

      const xml_element* derivation = nullptr;
      for (const auto& child : elem.children()) {
        if (is_annotation(child)) continue;
        if (derivation == nullptr &&
            (child.name().is_xs("restriction") || child.name().is_xs("list") ||
             child.name().is_xs("union"))) {
          derivation = &child;
          continue;
        }
        unexpected_child(child, elem, ctx);
      }

      if (derivation == nullptr) {
        ctx.error(elem, "simpleType requires restriction, list or union");
        return st;
      }

      const auto& kind = derivation->name().local_name();
      if (kind == "restriction") {
        st->set_variety(simple_type_variety::atomic);
        if (auto base = qname_attr(*derivation, "base", ctx))
          st->base().name = *base;
        for (const auto& child : derivation->children()) {
          if (is_annotation(child)) continue;
          if (child.name().is_xs("simpleType")) {
            if (!st->base().empty())
              ctx.error(child, "restriction has both a base and an inline type");
            st->base() = inline_simple_type(child, ctx);
          } else if (child.name().is_xs()) {
            parse_facet(child, st->facets(), ctx);
          } else {
            unexpected_child(child, *derivation, ctx);
          }
        }
        if (st->base().empty())
          ctx.error(*derivation, "restriction requires a base type");
      } else if (kind == "list") {
        st->set_variety(simple_type_variety::list);
        if (auto item = qname_attr(*derivation, "itemType", ctx))
          st->base().name = *item;
        for (const auto& child : derivation->children()) {
          if (is_annotation(child)) continue;
          if (child.name().is_xs("simpleType") && st->base().empty())
            st->base() = inline_simple_type(child, ctx);
          else
            unexpected_child(child, *derivation, ctx);
        }
        if (st->base().empty())
          ctx.error(*derivation, "list requires an item type");
      } else {
        st->set_variety(simple_type_variety::union_type);
        if (auto members = derivation->attribute("memberTypes")) {
          std::istringstream iss(*members);
          std::string token;
          while (iss >> token) {
            auto resolved = derivation->resolve_qname(token);
            if (!resolved) {
              ctx.error(*derivation, "unbound namespace prefix in "
                                     "memberTypes '" + token + "'");
              continue;
            }
            simple_type_ref ref;
            ref.name = *resolved;
            st->members().push_back(std::move(ref));
          }
        }
        for (const auto& child : derivation->children()) {
          if (is_annotation(child)) continue;
          if (child.name().is_xs("simpleType"))
            st->members().push_back(inline_simple_type(child, ctx));
          else
            unexpected_child(child, *derivation, ctx);
        }
        if (st->members().empty())
          ctx.error(*derivation, "union requires member types");
      }
      return st;
    }

    // --- attributes --------------------------------------------------------

    std::shared_ptr<schema_component>
    build_attribute(const xml_element& elem, build_context& ctx) {
      auto name = declared_name(elem, ctx, ctx.qualified_attributes());
      auto attr = std::make_shared<attribute_decl>(name, elem.line());

      if (auto ref = qname_attr(elem, "ref", ctx)) {
        if (ctx.top_level())
          ctx.error(elem, "global attribute cannot have a 'ref'");
        if (!name.empty())
          ctx.error(elem, "attribute cannot have both 'name' and 'ref'");
        attr->set_ref(*ref);
      } else if (name.empty()) {
        ctx.error(elem, "attribute requires a 'name' or a 'ref'");
      }

      if (auto type = qname_attr(elem, "type", ctx)) attr->type().name = *type;

      if (auto use = elem.attribute("use")) {
        if (ctx.top_level()) {
          ctx.error(elem, "global attribute cannot have a 'use'");
        } else if (*use == "required") {
          attr->set_use(attribute_use::required);
        } else if (*use == "prohibited") {
          attr->set_use(attribute_use::prohibited);
        } else if (*use != "optional") {
          ctx.error(elem, "invalid attribute use '" + *use + "'");
        }
      }
      if (auto def = elem.attribute("default")) attr->set_default_value(*def);
      if (auto fixed = elem.attribute("fixed")) attr->set_fixed_value(*fixed);
      if (attr->default_value() && attr->fixed_value())
        ctx.error(elem, "attribute cannot have both 'default' and 'fixed'");

      for (const auto& child : elem.children()) {
        if (is_annotation(child)) continue;
        if (child.name().is_xs("simpleType")) {
          if (!attr->type().name.empty())
            ctx.error(child, "attribute has both a 'type' and an inline type");
          attr->type() = inline_simple_type(child, ctx);
        } else {
          unexpected_child(child, elem, ctx);
        }
      }
      return attr;
    }

    // Handles the attribute-use children shared by complex types,
    // simple/complex content derivations and attribute groups. Returns false
    // for children that are not attribute uses.
    bool
    add_attribute_use(const xml_element& child, attribute_uses& uses,
                      build_context& ctx) {
      if (child.name().is_xs("attribute")) {
        uses.attributes.push_back(
            ctx.build_as<attribute_decl>(attribute_builder_key, child));
        return true;
      }
      if (child.name().is_xs("attributeGroup")) {
        uses.group_refs.push_back(
            ctx.build_as<attribute_group>(attribute_group_builder_key, child));
        return true;
      }
      if (child.name().is_xs("anyAttribute")) {
        if (uses.any_attribute)
          ctx.error(child, "more than one <anyAttribute>");
        uses.any_attribute =
            ctx.build_as<wildcard>(any_attribute_builder_key, child);
        return true;
      }
      return false;
    }

    std::shared_ptr<schema_component>
    build_attribute_group(const xml_element& elem, build_context& ctx) {
      auto name = declared_name(elem, ctx, true);
      auto group = std::make_shared<attribute_group>(name, elem.line());

      if (auto ref = qname_attr(elem, "ref", ctx)) {
        if (ctx.top_level())
          ctx.error(elem, "global attributeGroup cannot have a 'ref'");
        group->set_ref(*ref);
      } else {
        require_name(elem, name, ctx);
        if (!ctx.top_level())
          ctx.error(elem, "local attributeGroup requires a 'ref'");
      }

      for (const auto& child : elem.children()) {
        if (is_annotation(child)) continue;
        if (group->ref() || !add_attribute_use(child, group->uses(), ctx))
          unexpected_child(child, elem, ctx);
      }
      return group;
    }

    // --- wildcards ---------------------------------------------------------

    void
    parse_wildcard(const xml_element& elem, wildcard& w, build_context& ctx) {
      if (auto ns = elem.attribute("namespace")) {
        std::istringstream iss(*ns);
        std::vector<std::string> tokens;
        std::string token;
        while (iss >> token)
          tokens.push_back(token);
        w.set_namespaces(std::move(tokens), ctx.target_namespace());
      } else {
        w.set_namespaces({"##any"}, ctx.target_namespace());
      }
      if (auto pc = elem.attribute("processContents")) {
        if (*pc == "strict")
          w.set_process(process_contents::strict);
        else if (*pc == "lax")
          w.set_process(process_contents::lax);
        else if (*pc == "skip")
          w.set_process(process_contents::skip);
        else
          ctx.error(elem, "invalid processContents '" + *pc + "'");
      }
      for (const auto& child : elem.children()) {
        if (!is_annotation(child)) unexpected_child(child, elem, ctx);
      }
    }

    std::shared_ptr<schema_component>
    build_any_element(const xml_element& elem, build_context& ctx) {
      auto w = std::make_shared<wildcard>(component_kind::any_element,
                                          elem.line());
      w->set_occurs(parse_occurrence(elem, ctx));
      parse_wildcard(elem, *w, ctx);
      return w;
    }

    std::shared_ptr<schema_component>
    build_any_attribute(const xml_element& elem, build_context& ctx) {
      auto w = std::make_shared<wildcard>(component_kind::any_attribute,
                                          elem.line());
      parse_wildcard(elem, *w, ctx);
      return w;
    }

    // --- model groups ------------------------------------------------------

    bool
    is_compositor(const xml_element& elem) {
      return elem.name().is_xs("sequence") || elem.name().is_xs("choice") ||
             elem.name().is_xs("all");
    }

    void
    parse_compositor(const xml_element& elem, model_group& group,
                     build_context& ctx) {
      const auto& local = elem.name().local_name();
      if (local == "sequence")
        group.set_compositor(compositor_kind::sequence);
      else if (local == "choice")
        group.set_compositor(compositor_kind::choice);
      else
        group.set_compositor(compositor_kind::all);

      bool is_all = group.compositor() == compositor_kind::all;
      bool strict_all = is_all && ctx.version() == schema_version::v1_0;

      for (const auto& child : elem.children()) {
        if (is_annotation(child)) continue;
        if (child.name().is_xs("element")) {
          auto decl = ctx.build_as<element_decl>(element_builder_key, child);
          if (strict_all && decl->occurs().max_occurs > 1)
            ctx.error(child, "maxOccurs of an element in <all> must be 0 or 1");
          group.add_particle(decl);
        } else if (child.name().is_xs("any")) {
          if (strict_all) ctx.error(child, "<any> not allowed in <all>");
          group.add_particle(ctx.build(any_element_builder_key, child));
        } else if (child.name().is_xs("group") || is_compositor(child)) {
          if (strict_all || child.name().is_xs("all"))
            ctx.error(child, "<" + child.name().local_name() +
                                 "> not allowed in <" + local + ">");
          group.add_particle(ctx.build(group_builder_key, child));
        } else {
          unexpected_child(child, elem, ctx);
        }
      }
    }

    std::shared_ptr<schema_component>
    build_group(const xml_element& elem, build_context& ctx) {
      if (is_compositor(elem)) {
        auto group = std::make_shared<model_group>(qname{}, elem.line());
        group->set_occurs(parse_occurrence(elem, ctx));
        parse_compositor(elem, *group, ctx);
        return group;
      }

      // xs:group: a named definition or a reference
      auto name = declared_name(elem, ctx, true);
      auto group = std::make_shared<model_group>(name, elem.line());
      group->set_occurs(parse_occurrence(elem, ctx));

      if (auto ref = qname_attr(elem, "ref", ctx)) {
        if (ctx.top_level()) ctx.error(elem, "global group cannot have a 'ref'");
        group->set_ref(*ref);
        for (const auto& child : elem.children()) {
          if (!is_annotation(child)) unexpected_child(child, elem, ctx);
        }
        return group;
      }

      require_name(elem, name, ctx);
      const xml_element* compositor = nullptr;
      for (const auto& child : elem.children()) {
        if (is_annotation(child)) continue;
        if (compositor == nullptr && is_compositor(child)) {
          compositor = &child;
          continue;
        }
        unexpected_child(child, elem, ctx);
      }
      if (compositor == nullptr) {
        ctx.error(elem, "group definition requires a sequence, choice or all");
        return group;
      }
      parse_compositor(*compositor, *group, ctx);
      return group;
    }

    // --- complex types -----------------------------------------------------

    std::shared_ptr<model_group>
    build_content_group(const xml_element& child, build_context& ctx) {
      return ctx.build_as<model_group>(group_builder_key, child);
    }

    void
    parse_derivation_body(const xml_element& derivation, complex_type& ct,
                          bool simple, build_context& ctx) {
      for (const auto& child : derivation.children()) {
        if (is_annotation(child)) continue;
        if (add_attribute_use(child, ct.attributes(), ctx)) continue;
        if (!simple && (is_compositor(child) || child.name().is_xs("group"))) {
          if (ct.content())
            ctx.error(child, "complex type has more than one content group");
          ct.set_content(build_content_group(child, ctx));
          continue;
        }
        if (simple && derivation.name().is_xs("restriction") &&
            child.name().is_xs()) {
          // Facets restricting the simple content; not enforced.
          continue;
        }
        if (child.name().is_xs("assert") &&
            ctx.version() == schema_version::v1_1) {
          ct.set_has_assertions(true);
          continue;
        }
        unexpected_child(child, derivation, ctx);
      }
    }

    void
    parse_content(const xml_element& content, complex_type& ct,
                  build_context& ctx) {
      bool simple = content.name().is_xs("simpleContent");
      ct.set_simple_content(simple);
      if (!simple) {
        if (auto mixed = content.attribute("mixed"))
          ct.set_mixed(*mixed == "true" || *mixed == "1");
      }

      const xml_element* derivation = nullptr;
      for (const auto& child : content.children()) {
        if (is_annotation(child)) continue;
        if (derivation == nullptr && (child.name().is_xs("extension") ||
                                      child.name().is_xs("restriction"))) {
          derivation = &child;
          continue;
        }
        unexpected_child(child, content, ctx);
      }
      if (derivation == nullptr) {
        ctx.error(content, "<" + content.name().local_name() +
                               "> requires an extension or a restriction");
        return;
      }

      auto method = derivation->name().is_xs("extension")
                        ? derivation_method::extension
                        : derivation_method::restriction;
      auto base = qname_attr(*derivation, "base", ctx);
      if (!base) {
        ctx.error(*derivation, "derivation requires a 'base' attribute");
        base = qname{xs_namespace, "anyType"};
      }
      ct.set_base(method, *base);
      parse_derivation_body(*derivation, ct, simple, ctx);
    }

    std::shared_ptr<schema_component>
    build_complex_type(const xml_element& elem, build_context& ctx) {
      auto name = declared_name(elem, ctx, true);
      require_name(elem, name, ctx);
      if (!ctx.top_level() && !name.empty())
        ctx.error(elem, "local complexType cannot have a 'name'");

      auto ct = std::make_shared<complex_type>(name, elem.line());
      if (auto mixed = elem.attribute("mixed"))
        ct->set_mixed(*mixed == "true" || *mixed == "1");

      bool has_content_element = false;
      for (const auto& child : elem.children()) {
        if (is_annotation(child)) continue;
        if (child.name().is_xs("simpleContent") ||
            child.name().is_xs("complexContent")) {
          if (has_content_element || ct->content())
            ctx.error(child, "complex type has more than one content model");
          has_content_element = true;
          parse_content(child, *ct, ctx);
          continue;
        }
        if (is_compositor(child) || child.name().is_xs("group")) {
          if (has_content_element || ct->content())
            ctx.error(child, "complex type has more than one content model");
          ct->set_content(build_content_group(child, ctx));
          continue;
        }
        if (add_attribute_use(child, ct->attributes(), ctx)) continue;
        if (ctx.version() == schema_version::v1_1) {
          if (child.name().is_xs("assert")) {
            ct->set_has_assertions(true);
            continue;
          }
          if (child.name().is_xs("openContent")) continue;
        }
        unexpected_child(child, elem, ctx);
      }
      return ct;
    }

    // --- elements ----------------------------------------------------------

    std::shared_ptr<schema_component>
    build_element(const xml_element& elem, build_context& ctx) {
      auto name = declared_name(elem, ctx, ctx.qualified_elements());
      auto decl = std::make_shared<element_decl>(name, elem.line());
      decl->set_occurs(parse_occurrence(elem, ctx));

      if (auto ref = qname_attr(elem, "ref", ctx)) {
        if (ctx.top_level())
          ctx.error(elem, "global element cannot have a 'ref'");
        if (!name.empty())
          ctx.error(elem, "element cannot have both 'name' and 'ref'");
        decl->set_ref(*ref);
      } else if (name.empty()) {
        ctx.error(elem, "element requires a 'name' or a 'ref'");
      }

      if (auto type = qname_attr(elem, "type", ctx)) decl->type().name = *type;
      if (auto nillable = elem.attribute("nillable"))
        decl->set_nillable(*nillable == "true" || *nillable == "1");
      if (auto def = elem.attribute("default")) decl->set_default_value(*def);
      if (auto fixed = elem.attribute("fixed")) decl->set_fixed_value(*fixed);
      if (decl->default_value() && decl->fixed_value())
        ctx.error(elem, "element cannot have both 'default' and 'fixed'");

      for (const auto& child : elem.children()) {
        if (is_annotation(child)) continue;
        if (child.name().is_xs("complexType") ||
            child.name().is_xs("simpleType")) {
          if (!decl->type().name.empty() || decl->type().inline_type)
            ctx.error(child, "element has both a 'type' and an inline type");
          const auto& key = child.name().is_xs("complexType")
                                ? complex_type_builder_key
                                : simple_type_builder_key;
          decl->type().inline_type = ctx.build(key, child);
          continue;
        }
        if (child.name().is_xs("unique") || child.name().is_xs("key") ||
            child.name().is_xs("keyref")) {
          continue;
        }
        if (child.name().is_xs("alternative") &&
            ctx.version() == schema_version::v1_1) {
          continue;
        }
        unexpected_child(child, elem, ctx);
      }
      return decl;
    }

    named_builder
    make_builder(const std::string& name, std::string description,
                 component_builder build) {
      return named_builder{name, std::move(description), std::move(build),
                           false};
    }

  } // namespace

  builder_table
  default_builders() {
    builder_table table;
    auto add = [&table](const std::string& key, std::string description,
                        component_builder build) {
      table.emplace(key, make_builder(key, std::move(description),
                                      std::move(build)));
    };
    add(element_builder_key, "xs:element declarations and references",
        build_element);
    add(attribute_builder_key, "xs:attribute declarations and references",
        build_attribute);
    add(complex_type_builder_key, "xs:complexType definitions",
        build_complex_type);
    add(simple_type_builder_key, "xs:simpleType definitions",
        build_simple_type);
    add(group_builder_key, "xs:group, xs:sequence, xs:choice and xs:all",
        build_group);
    add(attribute_group_builder_key, "xs:attributeGroup",
        build_attribute_group);
    add(any_element_builder_key, "xs:any wildcards", build_any_element);
    add(any_attribute_builder_key, "xs:anyAttribute wildcards",
        build_any_attribute);
    return table;
  }

  std::shared_ptr<schema_component>
  build_context::build(const std::string& key, const xml_element& elem) {
    const auto& builder = builders_.at(key);

    struct depth_guard {
      std::size_t& depth;
      explicit depth_guard(std::size_t& d) : depth(d) { ++depth; }
      ~depth_guard() { --depth; }
    };

    std::shared_ptr<schema_component> component;
    {
      depth_guard guard(depth_);
      component = builder.build(elem, *this);
    }
    if (component) {
      if (schema_.owned_.insert(component.get()).second)
        schema_.components_.push_back(component);
    }
    return component;
  }

  void
  build_context::error(const xml_element& elem, std::string message) {
    schema_.errors_.push_back({std::move(message), elem.line()});
  }

  const std::string&
  build_context::target_namespace() const {
    return schema_.target_namespace_;
  }

  bool
  build_context::qualified_elements() const {
    return schema_.qualified_elements_;
  }

  bool
  build_context::qualified_attributes() const {
    return schema_.qualified_attributes_;
  }

  schema_version
  build_context::version() const {
    return schema_.version_;
  }

} // namespace xt
