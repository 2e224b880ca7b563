#include <gramc/comment_matcher.hpp>

namespace gramc {

  std::optional<std::size_t>
  match_comment_body(std::u32string_view text, std::size_t pos) {
    while (pos < text.size()) {
      if (text[pos] != U'*') {
        ++pos;
        continue;
      }
      std::size_t run_end = pos;
      while (run_end < text.size() && text[run_end] == U'*')
        ++run_end;
      if (run_end < text.size() && text[run_end] == U'/') return pos;
      pos = run_end;
    }
    return std::nullopt;
  }

  std::optional<comment_match>
  match_comment(std::u32string_view text, std::size_t pos) {
    if (text.substr(pos, 2) != U"/*") return std::nullopt;

    comment_match m;
    m.body_begin = pos + 2;
    // "/**" opens a docstring, but "/**/" is the empty comment.
    if (m.body_begin < text.size() && text[m.body_begin] == U'*' &&
        text.substr(m.body_begin, 2) != U"*/") {
      m.doc = true;
      ++m.body_begin;
    }

    auto body_end = match_comment_body(text, m.body_begin);
    if (!body_end) return std::nullopt;
    m.body_end = *body_end;

    std::size_t close = m.body_end;
    while (text[close] == U'*')
      ++close;
    m.end = close + 1;
    return m;
  }

} // namespace gramc
