#pragma once

#include <cstddef>
#include <string>

namespace gramc {

  struct source_location {
    std::size_t offset = 0;
    std::size_t line = 1;
    std::size_t column = 1;

    bool
    operator==(const source_location&) const = default;

    std::string
    to_string() const {
      return std::to_string(line) + ":" + std::to_string(column);
    }
  };

  // Half-open range of code-point offsets.
  struct source_span {
    std::size_t begin = 0;
    std::size_t end = 0;

    std::size_t
    size() const {
      return end - begin;
    }

    bool
    operator==(const source_span&) const = default;
  };

} // namespace gramc
