#pragma once

#include <vector>

namespace gramc {

  struct codepoint_range {
    char32_t first = 0;
    char32_t last = 0;

    bool
    operator==(const codepoint_range&) const = default;
  };

  // Predicate over a single code point: a set of inclusive ranges, optionally
  // negated. Ranges are kept sorted and merged.
  class codepoint_matcher {
  public:
    codepoint_matcher() = default;

    codepoint_matcher(std::vector<codepoint_range> ranges, bool negated);

    static codepoint_matcher
    single(char32_t cp);

    bool
    matches(char32_t cp) const;

    const std::vector<codepoint_range>&
    ranges() const {
      return ranges_;
    }

    bool
    negated() const {
      return negated_;
    }

    bool
    operator==(const codepoint_matcher&) const = default;

  private:
    std::vector<codepoint_range> ranges_;
    bool negated_ = false;
  };

} // namespace gramc
