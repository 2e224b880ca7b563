#pragma once

#include <gramc/source_location.hpp>

#include <string>

namespace gramc {

  struct token {
    std::string rule; // name of the token rule that matched
    std::string text; // matched text, UTF-8
    source_span span; // code-point offsets into the input
    source_location location; // where the token begins

    bool
    operator==(const token&) const = default;
  };

} // namespace gramc
