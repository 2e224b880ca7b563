#pragma once

#include <gramc/fragment_resolver.hpp>
#include <gramc/rule_set.hpp>
#include <gramc/token.hpp>
#include <gramc/token_automaton.hpp>
#include <gramc/utf8.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gramc {

  class token_stream;

  // One tokenizer step: the emitted token, or nothing when whitespace was
  // dropped, and the position to continue from.
  struct lex_step {
    std::optional<token> emitted;
    std::size_t next = 0;
  };

  // Longest-match tokenizer over the real tokens and the whitespace rule.
  // Ties on length go to the earliest-defined rule.
  class tokenizer {
  public:
    tokenizer(std::shared_ptr<const rule_set> rules,
              std::shared_ptr<const token_table> table,
              std::shared_ptr<const token_automaton> automaton);

    // Throws lex_error when no rule matches a non-empty prefix at `position`.
    // Token locations are found by scanning `input` up to `position`.
    lex_step
    next(std::u32string_view input, std::size_t position) const;

    // Same, with locations looked up in `lines`, built once over `input`.
    lex_step
    next(std::u32string_view input, std::size_t position,
         const line_index& lines) const;

    token_stream
    tokenize(std::string_view input) const;

    // Collects tokenize(input). Throws lex_error at the first failure.
    std::vector<token>
    tokenize_all(std::string_view input) const;

    // Competing rule names (real tokens and `_`) in definition order.
    std::vector<std::string>
    alphabet() const;

  private:
    friend class token_stream;

    lex_step
    step(std::u32string_view input, std::size_t position,
         const line_index* lines) const;

    std::shared_ptr<const rule_set> rules_;
    std::shared_ptr<const token_table> table_;
    std::shared_ptr<const token_automaton> automaton_;
    std::vector<std::size_t> candidates_; // rule indices, ascending
    std::size_t whitespace_ = static_cast<std::size_t>(-1);
  };

  // Lazy, finite token sequence over one input. Not restartable: to start
  // over, call tokenizer::tokenize again.
  class token_stream {
  public:
    token_stream(tokenizer lexer, std::u32string input);

    // The next token, or std::nullopt at end of input. Throws lex_error; the
    // stream stays at the failing position so the caller may skip() and
    // continue.
    std::optional<token>
    next();

    // Skip one code point, for skip-and-continue recovery.
    void
    skip();

    bool
    at_end() const {
      return pos_ >= input_.size();
    }

    std::size_t
    position() const {
      return pos_;
    }

    const std::u32string&
    input() const {
      return input_;
    }

  private:
    tokenizer lexer_;
    std::u32string input_;
    line_index lines_;
    std::size_t pos_ = 0;
  };

} // namespace gramc
