#include <xt/expat_reader.hpp>

#include <expat.h>

#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace xt {

  namespace {

    using prefix_bindings = xml_reader::namespace_map;

    struct attribute {
      qname name;
      std::string value;
    };

    struct event {
      xml_node_type type;
      qname name;
      std::string text;
      std::vector<attribute> attributes;
      std::size_t depth = 0;
      std::size_t line = 0;
      std::shared_ptr<const prefix_bindings> scope;
    };

    // Parse "uri\nlocal" into a qname. Unqualified names have no separator.
    qname
    parse_expat_name(const char* expat_name) {
      const char* sep = std::strchr(expat_name, '\n');
      if (sep == nullptr) { return qname{"", std::string(expat_name)}; }
      return qname{std::string(expat_name, sep), std::string(sep + 1)};
    }

    const std::string xml_namespace = "http://www.w3.org/XML/1998/namespace";

  } // namespace

  struct expat_reader::impl {
    std::vector<event> events;
    std::size_t cursor = 0;
    std::size_t current_depth = 0;
    XML_Parser parser = nullptr;

    // Scopes of the open elements; the front entry is the document scope.
    std::vector<std::shared_ptr<const prefix_bindings>> scopes;
    std::vector<std::pair<std::string, std::string>> pending;

    std::size_t
    current_line() const {
      return static_cast<std::size_t>(XML_GetCurrentLineNumber(parser));
    }

    static void XMLCALL
    on_start_namespace(void* user_data, const char* prefix, const char* uri) {
      auto* self = static_cast<impl*>(user_data);
      self->pending.emplace_back(prefix ? prefix : "", uri ? uri : "");
    }

    static void XMLCALL
    on_start_element(void* user_data, const char* name, const char** atts) {
      auto* self = static_cast<impl*>(user_data);
      self->current_depth++;

      if (self->pending.empty()) {
        self->scopes.push_back(self->scopes.back());
      } else {
        auto scope = std::make_shared<prefix_bindings>(*self->scopes.back());
        for (auto& [prefix, uri] : self->pending)
          (*scope)[prefix] = std::move(uri);
        self->pending.clear();
        self->scopes.push_back(std::move(scope));
      }

      event ev;
      ev.type = xml_node_type::start_element;
      ev.name = parse_expat_name(name);
      ev.depth = self->current_depth;
      ev.line = self->current_line();
      ev.scope = self->scopes.back();

      for (const char** p = atts; *p != nullptr; p += 2) {
        ev.attributes.push_back({parse_expat_name(p[0]), std::string(p[1])});
      }

      self->events.push_back(std::move(ev));
    }

    static void XMLCALL
    on_end_element(void* user_data, const char* name) {
      auto* self = static_cast<impl*>(user_data);

      event ev;
      ev.type = xml_node_type::end_element;
      ev.name = parse_expat_name(name);
      ev.depth = self->current_depth;
      ev.line = self->current_line();
      ev.scope = self->scopes.back();

      self->events.push_back(std::move(ev));
      self->scopes.pop_back();
      self->current_depth--;
    }

    static void XMLCALL
    on_character_data(void* user_data, const char* s, int len) {
      auto* self = static_cast<impl*>(user_data);

      // Coalesce adjacent character data into a single event
      if (!self->events.empty() &&
          self->events.back().type == xml_node_type::characters) {
        self->events.back().text.append(s, static_cast<std::size_t>(len));
        return;
      }

      event ev;
      ev.type = xml_node_type::characters;
      ev.text.assign(s, static_cast<std::size_t>(len));
      ev.depth = self->current_depth;
      ev.line = self->current_line();
      ev.scope = self->scopes.back();
      self->events.push_back(std::move(ev));
    }
  };

  expat_reader::expat_reader(std::string_view xml)
      : impl_(std::make_unique<impl>()) {
    // '\n' as the namespace separator
    XML_Parser parser = XML_ParserCreateNS(nullptr, '\n');
    if (parser == nullptr) {
      throw std::runtime_error("failed to create expat parser");
    }

    auto document_scope = std::make_shared<prefix_bindings>();
    (*document_scope)["xml"] = xml_namespace;
    impl_->scopes.push_back(std::move(document_scope));
    impl_->parser = parser;

    XML_SetUserData(parser, impl_.get());
    XML_SetElementHandler(parser, impl::on_start_element, impl::on_end_element);
    XML_SetCharacterDataHandler(parser, impl::on_character_data);
    XML_SetStartNamespaceDeclHandler(parser, impl::on_start_namespace);

    XML_Status status =
        XML_Parse(parser, xml.data(), static_cast<int>(xml.size()), XML_TRUE);

    if (status == XML_STATUS_ERROR) {
      std::string msg = "XML parse error at line ";
      msg += std::to_string(XML_GetCurrentLineNumber(parser));
      msg += ": ";
      msg += XML_ErrorString(XML_GetErrorCode(parser));
      XML_ParserFree(parser);
      impl_->parser = nullptr;
      throw std::runtime_error(msg);
    }

    XML_ParserFree(parser);
    impl_->parser = nullptr;
    impl_->scopes.clear();

    if (impl_->events.empty()) {
      throw std::runtime_error("XML parse error: no content");
    }
  }

  expat_reader::~expat_reader() = default;
  expat_reader::expat_reader(expat_reader&&) noexcept = default;
  expat_reader&
  expat_reader::operator=(expat_reader&&) noexcept = default;

  bool
  expat_reader::read() {
    if (impl_->cursor >= impl_->events.size()) { return false; }
    impl_->cursor++;
    return true;
  }

  xml_node_type
  expat_reader::node_type() const {
    return impl_->events[impl_->cursor - 1].type;
  }

  const qname&
  expat_reader::name() const {
    return impl_->events[impl_->cursor - 1].name;
  }

  std::size_t
  expat_reader::attribute_count() const {
    return impl_->events[impl_->cursor - 1].attributes.size();
  }

  const qname&
  expat_reader::attribute_name(std::size_t index) const {
    return impl_->events[impl_->cursor - 1].attributes[index].name;
  }

  std::string_view
  expat_reader::attribute_value(std::size_t index) const {
    return impl_->events[impl_->cursor - 1].attributes[index].value;
  }

  std::string_view
  expat_reader::text() const {
    return impl_->events[impl_->cursor - 1].text;
  }

  std::size_t
  expat_reader::depth() const {
    return impl_->events[impl_->cursor - 1].depth;
  }

  std::size_t
  expat_reader::line() const {
    return impl_->events[impl_->cursor - 1].line;
  }

  std::string_view
  expat_reader::namespace_uri_for_prefix(std::string_view prefix) const {
    const auto& scope = impl_->events[impl_->cursor - 1].scope;
    if (!scope) return {};
    auto it = scope->find(prefix);
    if (it == scope->end()) return {};
    return it->second;
  }

  xml_reader::namespace_map
  expat_reader::in_scope_namespaces() const {
    const auto& scope = impl_->events[impl_->cursor - 1].scope;
    if (!scope) return {};
    return *scope;
  }

} // namespace xt
