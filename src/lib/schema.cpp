#include <xt/builtin_types.hpp>
#include <xt/schema.hpp>

#include <stdexcept>
#include <string>

namespace xt {

  namespace {

    template <typename T>
    const T*
    find_in(const std::unordered_map<qname, const T*>& map, const qname& name) {
      auto it = map.find(name);
      return it == map.end() ? nullptr : it->second;
    }

    template <typename T>
    bool
    insert_global(std::unordered_map<qname, const T*>& map, const T* component) {
      return map.emplace(component->name(), component).second;
    }

  } // namespace

  schema::schema(const std::filesystem::path& path, schema_version version,
                 const builder_table& builders)
      : source_(path), version_(version) {
    build(load_xml_file(path), builders);
  }

  schema::schema(const xml_element& document, schema_version version,
                 const builder_table& builders)
      : version_(version) {
    build(document, builders);
  }

  void
  schema::build(const xml_element& root, const builder_table& builders) {
    if (!root.name().is_xs("schema")) {
      throw std::runtime_error("not an XSD schema document: root element is " +
                               root.name().str());
    }

    target_namespace_ = root.attribute("targetNamespace").value_or("");
    qualified_elements_ =
        root.attribute("elementFormDefault").value_or("") == "qualified";
    qualified_attributes_ =
        root.attribute("attributeFormDefault").value_or("") == "qualified";

    build_context ctx(*this, builders);
    for (const auto& child : root.children()) {
      const auto& name = child.name();
      if (!name.is_xs()) {
        errors_.push_back(
            {"unexpected " + name.str() + " in <schema>", child.line()});
        continue;
      }

      const auto& local = name.local_name();
      const std::string* key = nullptr;
      if (local == "element")
        key = &element_builder_key;
      else if (local == "attribute")
        key = &attribute_builder_key;
      else if (local == "complexType")
        key = &complex_type_builder_key;
      else if (local == "simpleType")
        key = &simple_type_builder_key;
      else if (local == "group")
        key = &group_builder_key;
      else if (local == "attributeGroup")
        key = &attribute_group_builder_key;

      if (key != nullptr) {
        add_global(ctx.build(*key, child));
        continue;
      }

      if (local == "annotation" || local == "import" || local == "include" ||
          local == "notation")
        continue;
      if (local == "defaultOpenContent" && version_ == schema_version::v1_1)
        continue;
      errors_.push_back({"unexpected <" + local + "> in <schema>", child.line()});
    }

    resolve();
  }

  void
  schema::add_global(const std::shared_ptr<schema_component>& component) {
    if (!component) return;
    component->set_global(true);
    if (component->name().empty()) return;

    bool inserted = true;
    switch (component->kind()) {
      case component_kind::element:
        inserted = insert_global(
            elements_, static_cast<const element_decl*>(component.get()));
        break;
      case component_kind::attribute:
        inserted = insert_global(
            attributes_, static_cast<const attribute_decl*>(component.get()));
        break;
      case component_kind::complex_type:
        inserted = !simple_types_.count(component->name()) &&
                   insert_global(complex_types_, static_cast<const complex_type*>(
                                                     component.get()));
        break;
      case component_kind::simple_type:
        inserted = !complex_types_.count(component->name()) &&
                   insert_global(simple_types_, static_cast<const simple_type*>(
                                                    component.get()));
        break;
      case component_kind::model_group:
        inserted = insert_global(
            groups_, static_cast<const model_group*>(component.get()));
        break;
      case component_kind::attribute_group:
        inserted = insert_global(
            attribute_groups_,
            static_cast<const attribute_group*>(component.get()));
        break;
      case component_kind::any_element:
      case component_kind::any_attribute:
        break;
    }
    if (!inserted) {
      errors_.push_back({"duplicate global " +
                             std::string(to_string(component->kind())) + " '" +
                             component->name().str() + "'",
                         component->line()});
    }
  }

  void
  schema::resolve() {
    auto unresolved = [this](const schema_component& c, const char* what,
                             const qname& name) {
      errors_.push_back({"unknown " + std::string(what) + " '" + name.str() +
                             "'",
                         c.line()});
    };

    auto resolve_simple = [&](const schema_component& owner,
                              simple_type_ref& ref) {
      if (ref.inline_type) {
        ref.type = ref.inline_type.get();
        return;
      }
      if (ref.name.empty()) return;
      if (auto st = find_simple_type(ref.name)) {
        ref.type = st;
      } else if (!(ref.name.is_xs() &&
                   is_builtin_type(ref.name.local_name(), version_)) ||
                 ref.name.is_xs("anyType")) {
        unresolved(owner, "simple type", ref.name);
      }
    };

    for (const auto& component : components_) {
      switch (component->kind()) {
        case component_kind::element: {
          auto& decl = static_cast<element_decl&>(*component);
          if (decl.ref()) {
            auto target = find_element(*decl.ref());
            if (target)
              decl.set_target(target);
            else
              unresolved(decl, "element", *decl.ref());
          }
          auto& type = decl.type();
          if (type.inline_type) {
            if (type.inline_type->kind() == component_kind::complex_type)
              type.complex =
                  static_cast<const complex_type*>(type.inline_type.get());
            else
              type.simple =
                  static_cast<const simple_type*>(type.inline_type.get());
          } else if (!type.name.empty()) {
            if (auto ct = find_complex_type(type.name))
              type.complex = ct;
            else if (auto st = find_simple_type(type.name))
              type.simple = st;
            else if (!(type.name.is_xs() &&
                       is_builtin_type(type.name.local_name(), version_)))
              unresolved(decl, "type", type.name);
          }
          break;
        }
        case component_kind::attribute: {
          auto& decl = static_cast<attribute_decl&>(*component);
          if (decl.ref()) {
            auto target = find_attribute(*decl.ref());
            if (target)
              decl.set_target(target);
            else
              unresolved(decl, "attribute", *decl.ref());
          }
          if (!decl.type().name.empty() && find_complex_type(decl.type().name)) {
            errors_.push_back({"attribute type '" + decl.type().name.str() +
                                   "' is a complex type",
                               decl.line()});
            break;
          }
          resolve_simple(decl, decl.type());
          break;
        }
        case component_kind::simple_type: {
          auto& st = static_cast<simple_type&>(*component);
          resolve_simple(st, st.base());
          for (auto& member : st.members())
            resolve_simple(st, member);
          if (st.base().type == &st)
            errors_.push_back({"simple type '" + st.name().str() +
                                   "' derives from itself",
                               st.line()});
          break;
        }
        case component_kind::complex_type: {
          auto& ct = static_cast<complex_type&>(*component);
          if (ct.derivation() == derivation_method::none) break;
          const auto& base = ct.base_name();
          if (auto base_ct = find_complex_type(base)) {
            if (base_ct == &ct) {
              errors_.push_back({"complex type '" + ct.name().str() +
                                     "' derives from itself",
                                 ct.line()});
              break;
            }
            if (ct.simple_content() && !base_ct->simple_content() &&
                ct.derivation() == derivation_method::extension) {
              errors_.push_back({"simpleContent base '" + base.str() +
                                     "' does not have simple content",
                                 ct.line()});
            }
            ct.set_base_complex(base_ct);
          } else if (ct.simple_content()) {
            ct.base_simple().name = base;
            resolve_simple(ct, ct.base_simple());
          } else if (!base.is_xs("anyType")) {
            unresolved(ct, "complex type", base);
          }
          break;
        }
        case component_kind::model_group: {
          auto& group = static_cast<model_group&>(*component);
          if (!group.ref()) break;
          auto target = find_group(*group.ref());
          if (target)
            group.set_target(target);
          else
            unresolved(group, "group", *group.ref());
          break;
        }
        case component_kind::attribute_group: {
          auto& group = static_cast<attribute_group&>(*component);
          if (!group.ref()) break;
          auto target = find_attribute_group(*group.ref());
          if (target)
            group.set_target(target);
          else
            unresolved(group, "attribute group", *group.ref());
          break;
        }
        case component_kind::any_element:
        case component_kind::any_attribute:
          break;
      }
    }
  }

  const element_decl*
  schema::find_element(const qname& name) const {
    return find_in(elements_, name);
  }

  const attribute_decl*
  schema::find_attribute(const qname& name) const {
    return find_in(attributes_, name);
  }

  const complex_type*
  schema::find_complex_type(const qname& name) const {
    return find_in(complex_types_, name);
  }

  const simple_type*
  schema::find_simple_type(const qname& name) const {
    return find_in(simple_types_, name);
  }

  const model_group*
  schema::find_group(const qname& name) const {
    return find_in(groups_, name);
  }

  const attribute_group*
  schema::find_attribute_group(const qname& name) const {
    return find_in(attribute_groups_, name);
  }

  std::vector<schema_error>
  schema::validate(const std::filesystem::path& instance) const {
    return validate(load_xml_file(instance));
  }

} // namespace xt
