#include <gramc/codepoint_matcher.hpp>

#include <algorithm>
#include <iterator>

namespace gramc {

  codepoint_matcher::codepoint_matcher(std::vector<codepoint_range> ranges,
                                       bool negated)
      : negated_(negated) {
    std::sort(ranges.begin(), ranges.end(),
              [](const codepoint_range& a, const codepoint_range& b) {
                return a.first < b.first;
              });
    for (const auto& r : ranges) {
      if (!ranges_.empty() && r.first <= ranges_.back().last + 1) {
        ranges_.back().last = std::max(ranges_.back().last, r.last);
        continue;
      }
      ranges_.push_back(r);
    }
  }

  codepoint_matcher
  codepoint_matcher::single(char32_t cp) {
    return codepoint_matcher({{cp, cp}}, false);
  }

  bool
  codepoint_matcher::matches(char32_t cp) const {
    auto it = std::upper_bound(
        ranges_.begin(), ranges_.end(), cp,
        [](char32_t c, const codepoint_range& r) { return c < r.first; });
    bool inside = it != ranges_.begin() && cp <= std::prev(it)->last;
    return inside != negated_;
  }

} // namespace gramc
