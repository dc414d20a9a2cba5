#pragma once

#include <xt/component_record.hpp>
#include <xt/schema_builders.hpp>

#include <functional>
#include <memory>
#include <set>
#include <string>
#include <utility>

namespace xt {

  // Wraps builders so that every instance they produce is appended to a
  // basic_component_record<Base> owned by the caller. The wrappers hold the
  // original builder by value and the record by reference; the record must
  // outlive them. A wrapped builder returns exactly what the original
  // returns and lets its exceptions through untouched, recording nothing in
  // that case.
  template <typename Base>
  class basic_builder_observer {
  public:
    using record_type = basic_component_record<Base>;

  private:
    record_type& record_;

  public:
    explicit basic_builder_observer(record_type& record) : record_(record) {}

    record_type&
    record() const {
      return record_;
    }

    // Construction through std::make_shared<T>, observed. T must derive
    // from Base.
    template <typename T>
    auto
    observe_constructor() const {
      return [&record = record_](auto&&... args) {
        auto instance = std::make_shared<T>(std::forward<decltype(args)>(args)...);
        record.append(instance);
        return instance;
      };
    }

    // A factory returning something convertible to std::shared_ptr<Base>.
    // Every call appends one entry, null results included.
    template <typename R, typename... Args>
    std::function<R(Args...)>
    observe(std::function<R(Args...)> factory) const {
      return [&record = record_, factory = std::move(factory)](Args... args) {
        R result = factory(std::forward<Args>(args)...);
        record.append(result);
        return result;
      };
    }

    void
    clear() const {
      record_.clear();
    }
  };

  // The observer of schema construction. Adds the wrapping of named schema
  // sub-builders and of whole builder tables.
  class builder_observer : public basic_builder_observer<schema_component> {
  public:
    using basic_builder_observer::basic_builder_observer;
    using basic_builder_observer::observe;

    // Name and description are carried over and the copy is flagged as
    // observed.
    named_builder
    observe(const named_builder& builder) const {
      named_builder wrapped = builder;
      wrapped.build = observe(builder.build);
      wrapped.observed = true;
      return wrapped;
    }

    // Wraps every entry of `table` except the keys in `exclude`, which are
    // copied as they are.
    builder_table
    observe_all(const builder_table& table,
                const std::set<std::string>& exclude = {}) const {
      builder_table observed;
      for (const auto& [key, builder] : table) {
        observed.emplace(key, exclude.count(key) ? builder : observe(builder));
      }
      return observed;
    }
  };

} // namespace xt
