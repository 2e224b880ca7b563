#pragma once

#include <gramc/ast.hpp>
#include <gramc/rule_set.hpp>
#include <gramc/token.hpp>
#include <gramc/token_automaton.hpp>
#include <gramc/variant_tagger.hpp>

#include <cstddef>
#include <memory>
#include <string_view>
#include <vector>

namespace gramc {

  struct parse_options {
    std::size_t max_depth = 1024; // nested production invocations
  };

  // Ordered-choice parser over the production rules of one grammar.
  //
  // Raw mode (string input) matches token references directly against the
  // text and skips the whitespace rule after every successful element. Token
  // mode (token input) matches each token reference against exactly one
  // token by rule name.
  //
  // All entry points throw std::invalid_argument when `start` is not a
  // production, and parse_error when the input is rejected.
  class parser {
  public:
    parser(std::shared_ptr<const rule_set> rules,
           std::shared_ptr<const variant_table> variants,
           std::shared_ptr<const token_automaton> automaton,
           parse_options options = {});

    // The whole input must be consumed.
    ast_node
    parse(std::string_view start, std::string_view input) const;

    ast_node
    parse(std::string_view start, const std::vector<token>& tokens) const;

    // The longest prefix `start` accepts; trailing input is left alone.
    ast_node
    parse_prefix(std::string_view start, std::string_view input) const;

    ast_node
    parse_prefix(std::string_view start,
                 const std::vector<token>& tokens) const;

    const parse_options&
    options() const {
      return options_;
    }

  private:
    std::shared_ptr<const rule_set> rules_;
    std::shared_ptr<const variant_table> variants_;
    std::shared_ptr<const token_automaton> automaton_;
    parse_options options_;

    std::size_t
    start_index(std::string_view start) const;
  };

} // namespace gramc
