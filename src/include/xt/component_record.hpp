#pragma once

#include <xt/schema_component.hpp>

#include <cstddef>
#include <memory>
#include <vector>

namespace xt {

  // Ordered log of instances produced by observed builders. Entries are only
  // appended, until clear() empties the log in place. Not synchronized: give
  // each concurrently running test its own record.
  template <typename Base>
  class basic_component_record {
  public:
    using value_type = std::shared_ptr<Base>;
    using container_type = std::vector<value_type>;
    using const_iterator = typename container_type::const_iterator;

  private:
    container_type entries_;

  public:
    void
    append(value_type entry) {
      entries_.push_back(std::move(entry));
    }

    void
    clear() {
      entries_.clear();
    }

    std::size_t
    size() const {
      return entries_.size();
    }

    bool
    empty() const {
      return entries_.empty();
    }

    const value_type&
    operator[](std::size_t i) const {
      return entries_[i];
    }

    const_iterator
    begin() const {
      return entries_.begin();
    }

    const_iterator
    end() const {
      return entries_.end();
    }
  };

  using component_record = basic_component_record<schema_component>;

} // namespace xt
