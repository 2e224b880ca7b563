#include <gramc/utf8.hpp>

#include <algorithm>
#include <stdexcept>

namespace gramc {

  namespace {

    constexpr char32_t replacement_char = 0xFFFD;

    bool
    is_continuation(unsigned char c) {
      return (c & 0xC0) == 0x80;
    }

    [[noreturn]] void
    malformed(std::size_t offset) {
      throw std::invalid_argument("malformed UTF-8 at byte " +
                                  std::to_string(offset));
    }

  } // namespace

  std::u32string
  utf8_decode(std::string_view bytes, bool strict) {
    std::u32string out;
    out.reserve(bytes.size());

    std::size_t i = 0;
    while (i < bytes.size()) {
      auto lead = static_cast<unsigned char>(bytes[i]);

      if (lead < 0x80) {
        out += static_cast<char32_t>(lead);
        ++i;
        continue;
      }

      std::size_t length = 0;
      char32_t cp = 0;
      char32_t min_value = 0;
      if ((lead & 0xE0) == 0xC0) {
        length = 2;
        cp = lead & 0x1F;
        min_value = 0x80;
      } else if ((lead & 0xF0) == 0xE0) {
        length = 3;
        cp = lead & 0x0F;
        min_value = 0x800;
      } else if ((lead & 0xF8) == 0xF0) {
        length = 4;
        cp = lead & 0x07;
        min_value = 0x10000;
      } else {
        if (strict) malformed(i);
        out += replacement_char;
        ++i;
        continue;
      }

      bool ok = i + length <= bytes.size();
      for (std::size_t k = 1; ok && k < length; ++k) {
        auto c = static_cast<unsigned char>(bytes[i + k]);
        if (!is_continuation(c))
          ok = false;
        else
          cp = (cp << 6) | (c & 0x3F);
      }
      // Overlong forms, surrogates and values past U+10FFFF are rejected.
      if (ok && (cp < min_value || cp > 0x10FFFF ||
                 (cp >= 0xD800 && cp <= 0xDFFF)))
        ok = false;

      if (!ok) {
        if (strict) malformed(i);
        out += replacement_char;
        ++i;
        continue;
      }

      out += cp;
      i += length;
    }
    return out;
  }

  void
  utf8_append(std::string& out, char32_t cp) {
    if (cp < 0x80) {
      out += static_cast<char>(cp);
    } else if (cp < 0x800) {
      out += static_cast<char>(0xC0 | (cp >> 6));
      out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
      out += static_cast<char>(0xE0 | (cp >> 12));
      out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
      out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp <= 0x10FFFF) {
      out += static_cast<char>(0xF0 | (cp >> 18));
      out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
      out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
      out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
      utf8_append(out, replacement_char);
    }
  }

  std::string
  utf8_encode(std::u32string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char32_t cp : text)
      utf8_append(out, cp);
    return out;
  }

  source_location
  locate(std::u32string_view text, std::size_t offset) {
    source_location loc;
    loc.offset = offset;
    for (std::size_t i = 0; i < offset && i < text.size(); ++i) {
      if (text[i] == U'\n') {
        ++loc.line;
        loc.column = 1;
      } else {
        ++loc.column;
      }
    }
    return loc;
  }

  line_index::line_index(std::u32string_view text) {
    starts_.push_back(0);
    for (std::size_t i = 0; i < text.size(); ++i)
      if (text[i] == U'\n') starts_.push_back(i + 1);
  }

  source_location
  line_index::locate(std::size_t offset) const {
    auto it = std::upper_bound(starts_.begin(), starts_.end(), offset);
    auto line = static_cast<std::size_t>(it - starts_.begin());
    return {offset, line, offset - starts_[line - 1] + 1};
  }

} // namespace gramc
