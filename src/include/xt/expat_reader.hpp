#pragma once

#include <xt/xml_reader.hpp>

#include <memory>
#include <string_view>

namespace xt {

  // xml_reader backed by expat. The whole document is parsed up front; a
  // malformed document throws std::runtime_error from the constructor.
  class expat_reader : public xml_reader {
  public:
    explicit expat_reader(std::string_view xml);
    ~expat_reader() override;

    expat_reader(const expat_reader&) = delete;
    expat_reader&
    operator=(const expat_reader&) = delete;
    expat_reader(expat_reader&&) noexcept;
    expat_reader&
    operator=(expat_reader&&) noexcept;

    bool
    read() override;

    xml_node_type
    node_type() const override;

    const qname&
    name() const override;

    std::size_t
    attribute_count() const override;

    const qname&
    attribute_name(std::size_t index) const override;

    std::string_view
    attribute_value(std::size_t index) const override;

    std::string_view
    text() const override;

    std::size_t
    depth() const override;

    std::size_t
    line() const override;

    std::string_view
    namespace_uri_for_prefix(std::string_view prefix) const override;

    namespace_map
    in_scope_namespaces() const override;

  private:
    struct impl;
    std::unique_ptr<impl> impl_;
  };

} // namespace xt
