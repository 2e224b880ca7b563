#pragma once

#include <gramc/codepoint_matcher.hpp>

#include <cstddef>
#include <string_view>
#include <vector>

namespace gramc {

  // Resolve the escape starting at text[pos] (which must be '#') and advance
  // pos past it. Throws grammar_error(invalid_escape) with the offset of the
  // '#' relative to `text`.
  //
  //   #t #n #r            tab, line feed, carriage return
  //   ## #' #" #- #^ #]   the character itself
  //   #xHH #uHHHH #UHHHHHHHH
  char32_t
  resolve_escape(std::u32string_view text, std::size_t& pos);

  // Number of code points an escape at text[pos] spans, without validating
  // it. Hex forms stop at the first non-hex digit. Used by scanners that only
  // need to find the end of a pattern.
  std::size_t
  escape_extent(std::u32string_view text, std::size_t pos);

  // "[...]" or "[^...]"
  codepoint_matcher
  compile_character_set(std::u32string_view text);

  // '...' or "..." -- one matcher per code point.
  std::vector<codepoint_matcher>
  compile_string_literal(std::u32string_view text);

  // A bare escape such as #x41.
  codepoint_matcher
  compile_character_literal(std::u32string_view text);

} // namespace gramc
