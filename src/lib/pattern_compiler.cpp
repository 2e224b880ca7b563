#include <gramc/pattern_compiler.hpp>

#include <gramc/error.hpp>
#include <gramc/utf8.hpp>

#include <algorithm>
#include <string>

namespace gramc {

  namespace {

    source_location
    relative(std::size_t offset) {
      return {offset, 1, offset + 1};
    }

    [[noreturn]] void
    fail(grammar_errc kind, const std::string& msg, std::size_t offset) {
      throw grammar_error(kind, msg, {}, relative(offset));
    }

    int
    hex_value(char32_t c) {
      if (c >= U'0' && c <= U'9') return static_cast<int>(c - U'0');
      if (c >= U'a' && c <= U'f') return static_cast<int>(c - U'a') + 10;
      if (c >= U'A' && c <= U'F') return static_cast<int>(c - U'A') + 10;
      return -1;
    }

    std::size_t
    hex_digits_for(char32_t form) {
      switch (form) {
        case U'x':
          return 2;
        case U'u':
          return 4;
        case U'U':
          return 8;
        default:
          return 0;
      }
    }

    std::string
    quote(std::u32string_view text) {
      return "'" + utf8_encode(text) + "'";
    }

    // One set entry endpoint: an escape or a plain character.
    char32_t
    read_set_unit(std::u32string_view text, std::size_t& pos) {
      char32_t c = text[pos];
      if (c == U'#') return resolve_escape(text, pos);
      if (c == U'^' || c == U'-' || c == U']')
        fail(grammar_errc::syntax,
             quote(text.substr(pos, 1)) +
                 " must be escaped inside a character set",
             pos);
      ++pos;
      return c;
    }

  } // namespace

  char32_t
  resolve_escape(std::u32string_view text, std::size_t& pos) {
    std::size_t start = pos;
    if (pos + 1 >= text.size())
      fail(grammar_errc::invalid_escape, "incomplete escape sequence", start);

    char32_t form = text[pos + 1];
    switch (form) {
      case U't':
        pos += 2;
        return U'\t';
      case U'n':
        pos += 2;
        return U'\n';
      case U'r':
        pos += 2;
        return U'\r';
      case U'#':
      case U'\'':
      case U'"':
      case U'-':
      case U'^':
      case U']':
        pos += 2;
        return form;
      default:
        break;
    }

    std::size_t digits = hex_digits_for(form);
    if (digits == 0)
      fail(grammar_errc::invalid_escape,
           "unknown escape " + quote(text.substr(start, 2)), start);

    char32_t value = 0;
    for (std::size_t k = 0; k < digits; ++k) {
      std::size_t at = pos + 2 + k;
      int v = at < text.size() ? hex_value(text[at]) : -1;
      if (v < 0)
        fail(grammar_errc::invalid_escape,
             "escape " + quote(text.substr(start, 2)) + " needs " +
                 std::to_string(digits) + " hex digits",
             start);
      value = (value << 4) | static_cast<char32_t>(v);
    }
    if (value >= 0xD800 && value <= 0xDFFF)
      fail(grammar_errc::invalid_escape,
           "escape " + quote(text.substr(start, 2 + digits)) +
               " is a surrogate",
           start);
    if (value > 0x10FFFF)
      fail(grammar_errc::invalid_escape,
           "escape " + quote(text.substr(start, 2 + digits)) +
               " is not a Unicode code point",
           start);

    pos += 2 + digits;
    return value;
  }

  std::size_t
  escape_extent(std::u32string_view text, std::size_t pos) {
    if (pos + 1 >= text.size()) return text.size() - pos;
    std::size_t digits = hex_digits_for(text[pos + 1]);
    std::size_t len = 2;
    while (len < 2 + digits && pos + len < text.size() &&
           hex_value(text[pos + len]) >= 0)
      ++len;
    return len;
  }

  codepoint_matcher
  compile_character_set(std::u32string_view text) {
    if (text.size() < 2 || text.front() != U'[' || text.back() != U']')
      fail(grammar_errc::syntax, "malformed character set", 0);

    std::size_t end = text.size() - 1;
    std::size_t pos = 1;
    bool negated = false;
    if (pos < end && text[pos] == U'^') {
      negated = true;
      ++pos;
    }

    std::vector<codepoint_range> ranges;
    while (pos < end) {
      std::size_t entry = pos;
      char32_t from = read_set_unit(text, pos);
      char32_t to = from;
      if (pos < end && text[pos] == U'-') {
        ++pos;
        if (pos >= end)
          fail(grammar_errc::syntax, "incomplete range in character set",
               entry);
        to = read_set_unit(text, pos);
        if (to < from)
          fail(grammar_errc::syntax,
               "reversed range " + quote(text.substr(entry, pos - entry)),
               entry);
      }
      if (pos > end)
        fail(grammar_errc::invalid_escape,
             "escape runs past the end of the character set", entry);
      ranges.push_back({from, to});
    }
    return codepoint_matcher(std::move(ranges), negated);
  }

  std::vector<codepoint_matcher>
  compile_string_literal(std::u32string_view text) {
    if (text.size() < 2 || (text.front() != U'\'' && text.front() != U'"') ||
        text.back() != text.front())
      fail(grammar_errc::syntax, "malformed string literal", 0);

    std::size_t end = text.size() - 1;
    std::vector<codepoint_matcher> sequence;
    std::size_t pos = 1;
    while (pos < end) {
      char32_t c = text[pos];
      if (c == U'#') {
        std::size_t at = pos;
        c = resolve_escape(text, pos);
        if (pos > end)
          fail(grammar_errc::invalid_escape,
               "escape runs past the end of the string literal", at);
      } else {
        ++pos;
      }
      sequence.push_back(codepoint_matcher::single(c));
    }

    if (sequence.empty())
      fail(grammar_errc::empty_literal,
           "string literals must match at least one character", 0);
    return sequence;
  }

  codepoint_matcher
  compile_character_literal(std::u32string_view text) {
    if (text.empty() || text.front() != U'#')
      fail(grammar_errc::syntax, "character literal must start with '#'", 0);
    std::size_t pos = 0;
    char32_t c = resolve_escape(text, pos);
    if (pos != text.size())
      fail(grammar_errc::invalid_escape,
           "trailing characters after escape " + quote(text), 0);
    return codepoint_matcher::single(c);
  }

} // namespace gramc
