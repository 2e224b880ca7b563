#include <gramc/fragment_resolver.hpp>

#include <gramc/error.hpp>

#include <algorithm>

namespace gramc {

  namespace {

    enum class mark { unvisited, active, done };

    struct token_edge {
      std::size_t target;
      const symbol_ref* ref;
    };

    class cycle_checker {
    public:
      cycle_checker(const rule_set& rules,
                    const std::vector<std::vector<token_edge>>& edges)
          : rules_(rules), edges_(edges), marks_(rules.size()) {}

      void
      check() {
        for (std::size_t i = 0; i < rules_.size(); ++i)
          if (rules_[i].is_token_kind() && marks_[i] == mark::unvisited)
            visit(i);
      }

    private:
      const rule_set& rules_;
      const std::vector<std::vector<token_edge>>& edges_;
      std::vector<mark> marks_;
      std::vector<std::size_t> path_;

      void
      visit(std::size_t i) {
        marks_[i] = mark::active;
        path_.push_back(i);
        for (const auto& e : edges_[i]) {
          if (marks_[e.target] == mark::active) fail(e);
          if (marks_[e.target] == mark::unvisited) visit(e.target);
        }
        path_.pop_back();
        marks_[i] = mark::done;
      }

      [[noreturn]] void
      fail(const token_edge& closing) {
        auto from = std::find(path_.begin(), path_.end(), closing.target);
        std::string cycle;
        for (auto it = from; it != path_.end(); ++it)
          cycle += rules_[*it].name + " -> ";
        cycle += rules_[closing.target].name;
        throw grammar_error(grammar_errc::recursive_token,
                            "token rules must not be recursive: " + cycle,
                            rules_[path_.back()].name, closing.ref->location);
      }
    };

  } // namespace

  token_table::token_table(std::vector<std::string> real_tokens,
                           std::vector<std::string> fragments,
                           std::vector<std::string> unused_fragments)
      : real_tokens_(std::move(real_tokens)), fragments_(std::move(fragments)),
        unused_fragments_(std::move(unused_fragments)),
        real_set_(real_tokens_.begin(), real_tokens_.end()),
        fragment_set_(fragments_.begin(), fragments_.end()) {}

  bool
  token_table::is_real(std::string_view name) const {
    return real_set_.count(std::string(name)) != 0;
  }

  bool
  token_table::is_fragment(std::string_view name) const {
    return fragment_set_.count(std::string(name)) != 0;
  }

  token_table
  resolve_fragments(const rule_set& rules) {
    const std::size_t n = rules.size();

    // Token-only reference subgraph.
    std::vector<std::vector<token_edge>> edges(n);
    for (std::size_t i = 0; i < n; ++i) {
      const auto& r = rules[i];
      if (!r.is_token_kind()) continue;
      std::vector<const symbol_ref*> refs;
      collect_refs(r, refs);
      for (const auto* ref : refs) {
        auto j = rules.index_of(ref->name);
        if (rules[j].kind == rule_kind::production)
          throw grammar_error(grammar_errc::invalid_token_reference,
                              "token patterns cannot refer to production "
                              "rule '" +
                                  ref->name + "'",
                              r.name, ref->location);
        edges[i].push_back({j, ref});
      }
    }

    cycle_checker(rules, edges).check();

    std::vector<bool> real(n, false);
    for (std::size_t i = 0; i < n; ++i) {
      const auto& r = rules[i];
      if (r.synthetic) real[i] = true;
      if (r.kind != rule_kind::production) continue;
      std::vector<const symbol_ref*> refs;
      collect_refs(r, refs);
      for (const auto* ref : refs) {
        auto j = rules.index_of(ref->name);
        if (rules[j].kind == rule_kind::token) real[j] = true;
      }
    }

    // Follow token-to-token references from every pattern that is actually
    // matched, so fragments only reachable from dead fragments are reported.
    std::vector<bool> used(n, false);
    std::vector<std::size_t> pending;
    for (std::size_t i = 0; i < n; ++i) {
      if (real[i] || rules[i].kind == rule_kind::whitespace) {
        used[i] = true;
        pending.push_back(i);
      }
    }
    while (!pending.empty()) {
      auto i = pending.back();
      pending.pop_back();
      for (const auto& e : edges[i]) {
        if (used[e.target]) continue;
        used[e.target] = true;
        pending.push_back(e.target);
      }
    }

    std::vector<std::string> real_tokens;
    std::vector<std::string> fragments;
    std::vector<std::string> unused;
    for (std::size_t i = 0; i < n; ++i) {
      const auto& r = rules[i];
      if (r.kind != rule_kind::token) continue;
      if (real[i]) {
        real_tokens.push_back(r.name);
        continue;
      }
      fragments.push_back(r.name);
      if (!used[i]) unused.push_back(r.name);
    }

    return token_table(std::move(real_tokens), std::move(fragments),
                       std::move(unused));
  }

} // namespace gramc
