#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

namespace gramc {

  struct comment_match {
    std::size_t end = 0;        // one past the closing "*/"
    std::size_t body_begin = 0; // after the opening "/*" (or "/**")
    std::size_t body_end = 0;   // start of the closing run of '*'
    bool doc = false;           // opened with "/**" and is not "/**/"
  };

  // End of a comment body starting at `pos` (just after "/*"): the offset of
  // the '*' run that is directly followed by '/'. Runs of '*' not followed by
  // '/' belong to the body. Returns std::nullopt if the input ends first.
  std::optional<std::size_t>
  match_comment_body(std::u32string_view text, std::size_t pos);

  // Match a complete "/* ... */" or "/** ... */" comment at `pos`.
  std::optional<comment_match>
  match_comment(std::u32string_view text, std::size_t pos);

} // namespace gramc
