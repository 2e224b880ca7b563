#include <gramc/token_automaton.hpp>

#include <algorithm>
#include <type_traits>

namespace gramc {

  token_automaton::token_automaton(const rule_set& rules)
      : starts_(rules.size(), no_state) {
    for (std::size_t i = 0; i < rules.size(); ++i) {
      if (!rules[i].is_token_kind()) continue;
      state accept;
      accept.kind = state_kind::accept;
      accept.rule = i;
      starts_[i] = build_rule(rules, i, add_state(std::move(accept)));
    }
  }

  std::size_t
  token_automaton::add_state(state s) {
    states_.push_back(std::move(s));
    return states_.size() - 1;
  }

  std::size_t
  token_automaton::build_rule(const rule_set& rules, std::size_t rule,
                              std::size_t next) {
    const auto& alts = rules[rule].alternatives;
    if (alts.size() == 1) return build(rules, alts.front().body, next);

    state split;
    for (const auto& alt : alts)
      split.epsilon.push_back(build(rules, alt.body, next));
    return add_state(std::move(split));
  }

  std::size_t
  token_automaton::build(const rule_set& rules, const concatenation& body,
                         std::size_t next) {
    for (auto it = body.items.rbegin(); it != body.items.rend(); ++it)
      next = build(rules, *it, next);
    return next;
  }

  std::size_t
  token_automaton::build(const rule_set& rules, const repetition& item,
                         std::size_t next) {
    switch (item.quantity) {
      case quantifier::one:
        return build(rules, item.inner, next);
      case quantifier::maybe: {
        state split;
        split.epsilon = {build(rules, item.inner, next), next};
        return add_state(std::move(split));
      }
      case quantifier::any:
      case quantifier::many: {
        // The loop state is patched once the body exists.
        auto loop = add_state(state{});
        auto body = build(rules, item.inner, loop);
        states_[loop].epsilon = {body, next};
        return item.quantity == quantifier::any ? loop : body;
      }
    }
    return next;
  }

  std::size_t
  token_automaton::build(const rule_set& rules, const singular& s,
                         std::size_t next) {
    return std::visit(
        [&](const auto& node) -> std::size_t {
          using T = std::decay_t<decltype(node)>;

          if constexpr (std::is_same_v<T, nested>) {
            state split;
            for (const auto& choice : node.body->choices)
              split.epsilon.push_back(build(rules, choice, next));
            return add_state(std::move(split));
          }

          if constexpr (std::is_same_v<T, symbol_ref>) {
            return build_rule(rules, rules.index_of(node.name), next);
          }

          if constexpr (std::is_same_v<T, literal>) {
            auto at = next;
            for (auto it = node.sequence.rbegin(); it != node.sequence.rend();
                 ++it) {
              state step;
              step.kind = state_kind::step;
              step.on = *it;
              step.next = at;
              at = add_state(std::move(step));
            }
            return at;
          }

          if constexpr (std::is_same_v<T, character_set>) {
            state step;
            step.kind = state_kind::step;
            step.on = node.matcher;
            step.next = next;
            return add_state(std::move(step));
          }
        },
        s.data());
  }

  void
  token_automaton::closure(std::vector<std::size_t>& set,
                           std::vector<char>& seen) const {
    std::fill(seen.begin(), seen.end(), 0);
    std::vector<std::size_t> work(set.rbegin(), set.rend());
    set.clear();
    while (!work.empty()) {
      auto s = work.back();
      work.pop_back();
      if (seen[s]) continue;
      seen[s] = 1;
      set.push_back(s);
      const auto& st = states_[s];
      if (st.kind == state_kind::split)
        work.insert(work.end(), st.epsilon.rbegin(), st.epsilon.rend());
    }
  }

  std::optional<token_automaton::match>
  token_automaton::run(std::u32string_view text, std::size_t pos,
                       std::vector<std::size_t> current) const {
    std::vector<char> seen(states_.size(), 0);
    closure(current, seen);

    std::optional<match> best;
    std::vector<std::size_t> next;
    for (std::size_t i = pos;; ++i) {
      std::size_t accepted = no_state;
      for (auto s : current) {
        const auto& st = states_[s];
        if (st.kind == state_kind::accept) accepted = std::min(accepted, st.rule);
      }
      if (accepted != no_state && i > pos) best = match{i - pos, accepted};

      if (i >= text.size() || current.empty()) break;

      next.clear();
      for (auto s : current) {
        const auto& st = states_[s];
        if (st.kind == state_kind::step && st.on.matches(text[i]))
          next.push_back(st.next);
      }
      closure(next, seen);
      current.swap(next);
    }
    return best;
  }

  std::optional<token_automaton::match>
  token_automaton::longest_match(
      std::u32string_view text, std::size_t pos,
      const std::vector<std::size_t>& candidates) const {
    std::vector<std::size_t> start;
    for (auto r : candidates)
      if (has_rule(r)) start.push_back(starts_[r]);
    if (start.empty()) return std::nullopt;
    return run(text, pos, std::move(start));
  }

  std::optional<std::size_t>
  token_automaton::match_rule(std::u32string_view text, std::size_t pos,
                              std::size_t rule) const {
    if (!has_rule(rule)) return std::nullopt;
    auto m = run(text, pos, {starts_[rule]});
    if (!m) return std::nullopt;
    return m->length;
  }

} // namespace gramc
