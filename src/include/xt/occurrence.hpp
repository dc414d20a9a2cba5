#pragma once

#include <xt/schema_fwd.hpp>

#include <cstddef>

namespace xt {

  // minOccurs/maxOccurs of a particle. max_occurs is `unbounded` for
  // maxOccurs="unbounded".
  struct occurrence {
    std::size_t min_occurs = 1;
    std::size_t max_occurs = 1;

    // True when a particle already matched `count` times may match again.
    bool
    admits_another(std::size_t count) const {
      return count < max_occurs;
    }

    bool
    satisfied_by(std::size_t count) const {
      return count >= min_occurs;
    }

    bool
    operator==(const occurrence&) const = default;
  };

} // namespace xt
