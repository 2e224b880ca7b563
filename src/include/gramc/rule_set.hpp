#pragma once

#include <gramc/grammar_model.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace gramc {

  // The finalized, immutable rules of one grammar, ordered by
  // first_definition_index. Rule indices into rules() are stable and follow
  // definition order, so a smaller index always means an earlier definition.
  class rule_set {
  public:
    explicit rule_set(std::vector<rule> rules);

    rule_set(const rule_set&) = delete;
    rule_set&
    operator=(const rule_set&) = delete;
    rule_set(rule_set&&) = default;
    rule_set&
    operator=(rule_set&&) = default;

    const std::vector<rule>&
    rules() const {
      return rules_;
    }

    std::size_t
    size() const {
      return rules_.size();
    }

    const rule*
    find(std::string_view name) const;

    // Throws std::out_of_range for unknown names.
    const rule&
    at(std::string_view name) const;

    std::size_t
    index_of(std::string_view name) const;

    const rule&
    operator[](std::size_t index) const {
      return rules_[index];
    }

    // The `_` rule, or nullptr when the grammar defines none.
    const rule*
    whitespace() const;

    // The first production in definition order, or nullptr.
    const rule*
    first_production() const;

  private:
    std::vector<rule> rules_;
    std::unordered_map<std::string, std::size_t> index_;
  };

} // namespace gramc
