#pragma once

#include <gramc/rule_set.hpp>

#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace gramc {

  // Classification of token-kind rules. Real tokens are referenced from a
  // production body (synthetic tokens always are); the remaining named token
  // rules are fragments, inlined into the patterns that use them.
  class token_table {
  public:
    token_table(std::vector<std::string> real_tokens,
                std::vector<std::string> fragments,
                std::vector<std::string> unused_fragments);

    // In definition order.
    const std::vector<std::string>&
    real_tokens() const {
      return real_tokens_;
    }

    // In definition order.
    const std::vector<std::string>&
    fragments() const {
      return fragments_;
    }

    // Fragments that no token pattern references either.
    const std::vector<std::string>&
    unused_fragments() const {
      return unused_fragments_;
    }

    bool
    is_real(std::string_view name) const;

    bool
    is_fragment(std::string_view name) const;

  private:
    std::vector<std::string> real_tokens_;
    std::vector<std::string> fragments_;
    std::vector<std::string> unused_fragments_;
    std::unordered_set<std::string> real_set_;
    std::unordered_set<std::string> fragment_set_;
  };

  // Classify token rules and validate the token reference graph. Throws
  // grammar_error(invalid_token_reference) when a token or whitespace rule
  // refers to a production, and grammar_error(recursive_token) on a cycle
  // among token-kind rules.
  token_table
  resolve_fragments(const rule_set& rules);

} // namespace gramc
