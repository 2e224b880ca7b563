#pragma once

#include <gramc/ast.hpp>
#include <gramc/fragment_resolver.hpp>
#include <gramc/parser.hpp>
#include <gramc/rule_set.hpp>
#include <gramc/token.hpp>
#include <gramc/token_automaton.hpp>
#include <gramc/tokenizer.hpp>
#include <gramc/variant_tagger.hpp>

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace gramc {

  using diagnostic_fn = std::function<void(const std::string&)>;

  struct compile_options {
    bool warnings = true;
    diagnostic_fn on_warning; // default: "gramc: warning: ..." on std::cerr
    parse_options parse_defaults;
  };

  // Everything built from one grammar source. The components share the
  // immutable rule set and may be used from several threads at once.
  struct compiled_grammar {
    std::shared_ptr<const rule_set> rules;
    std::shared_ptr<const token_table> alphabet;
    std::shared_ptr<const variant_table> variants;
    std::shared_ptr<const token_automaton> automaton;
    tokenizer lexer;
    parser syntax;

    std::vector<token>
    tokenize(std::string_view input) const {
      return lexer.tokenize_all(input);
    }

    ast_node
    parse(std::string_view start, std::string_view input) const {
      return syntax.parse(start, input);
    }
  };

  // Compile grammar source text. Throws grammar_error; nothing partial is
  // returned. Non-fatal findings (unused fragments, productions unreachable
  // from the first production) are reported through options.on_warning.
  compiled_grammar
  compile_grammar(std::string_view source, const compile_options& options = {});

} // namespace gramc
