#pragma once

#include <gramc/source_location.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace gramc {

  // Decode UTF-8 into code points. Malformed sequences decode to U+FFFD
  // unless `strict` is set, in which case std::invalid_argument is thrown
  // with the byte offset of the bad sequence.
  std::u32string
  utf8_decode(std::string_view bytes, bool strict = false);

  std::string
  utf8_encode(std::u32string_view text);

  void
  utf8_append(std::string& out, char32_t cp);

  // Line and column (both 1-based) of a code-point offset.
  source_location
  locate(std::u32string_view text, std::size_t offset);

  // Precomputed line starts, for repeated lookups over one text.
  class line_index {
  public:
    explicit line_index(std::u32string_view text);

    source_location
    locate(std::size_t offset) const;

  private:
    std::vector<std::size_t> starts_;
  };

} // namespace gramc
