#pragma once

#include <gramc/codepoint_matcher.hpp>
#include <gramc/rule_set.hpp>

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace gramc {

  // Thompson NFA over code points holding every token-kind rule (real tokens,
  // fragments and the whitespace rule). Each rule gets its own start state and
  // accept state; references between token rules are inlined by copying the
  // referenced rule's states, which is finite because token rules are not
  // recursive.
  class token_automaton {
  public:
    struct match {
      std::size_t length = 0;
      std::size_t rule = 0; // index into the rule_set
    };

    explicit token_automaton(const rule_set& rules);

    // Longest non-empty match at `pos` among `candidates` (rule indices).
    // Among equally long matches the smallest rule index wins, which is the
    // earliest definition.
    std::optional<match>
    longest_match(std::u32string_view text, std::size_t pos,
                  const std::vector<std::size_t>& candidates) const;

    // Length of the longest non-empty match of a single rule at `pos`.
    std::optional<std::size_t>
    match_rule(std::u32string_view text, std::size_t pos,
               std::size_t rule) const;

    bool
    has_rule(std::size_t rule) const {
      return rule < starts_.size() && starts_[rule] != no_state;
    }

    std::size_t
    state_count() const {
      return states_.size();
    }

  private:
    static constexpr std::size_t no_state = static_cast<std::size_t>(-1);

    enum class state_kind { step, split, accept };

    struct state {
      state_kind kind = state_kind::split;
      codepoint_matcher on;             // step
      std::size_t next = no_state;      // step
      std::vector<std::size_t> epsilon; // split
      std::size_t rule = 0;             // accept
    };

    std::vector<state> states_;
    std::vector<std::size_t> starts_;

    std::size_t
    add_state(state s);

    std::size_t
    build_rule(const rule_set& rules, std::size_t rule, std::size_t next);

    std::size_t
    build(const rule_set& rules, const concatenation& body, std::size_t next);

    std::size_t
    build(const rule_set& rules, const repetition& item, std::size_t next);

    std::size_t
    build(const rule_set& rules, const singular& s, std::size_t next);

    void
    closure(std::vector<std::size_t>& set, std::vector<char>& seen) const;

    std::optional<match>
    run(std::u32string_view text, std::size_t pos,
        std::vector<std::size_t> start) const;
  };

} // namespace gramc
