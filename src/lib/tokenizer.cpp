#include <gramc/tokenizer.hpp>

#include <gramc/error.hpp>
#include <gramc/utf8.hpp>

#include <stdexcept>

namespace gramc {

  tokenizer::tokenizer(std::shared_ptr<const rule_set> rules,
                       std::shared_ptr<const token_table> table,
                       std::shared_ptr<const token_automaton> automaton)
      : rules_(std::move(rules)), table_(std::move(table)),
        automaton_(std::move(automaton)) {
    for (std::size_t i = 0; i < rules_->size(); ++i) {
      const auto& r = (*rules_)[i];
      if (r.kind == rule_kind::whitespace) {
        whitespace_ = i;
        candidates_.push_back(i);
      } else if (r.kind == rule_kind::token && table_->is_real(r.name)) {
        candidates_.push_back(i);
      }
    }
  }

  lex_step
  tokenizer::next(std::u32string_view input, std::size_t position) const {
    return step(input, position, nullptr);
  }

  lex_step
  tokenizer::next(std::u32string_view input, std::size_t position,
                  const line_index& lines) const {
    return step(input, position, &lines);
  }

  lex_step
  tokenizer::step(std::u32string_view input, std::size_t position,
                  const line_index* lines) const {
    if (position >= input.size())
      throw std::out_of_range("tokenizer: position is at end of input");

    auto where = [&] {
      return lines ? lines->locate(position) : locate(input, position);
    };

    auto m = automaton_->longest_match(input, position, candidates_);
    if (!m) throw lex_error(where(), alphabet());

    std::size_t end = position + m->length;
    if (m->rule == whitespace_) return {std::nullopt, end};

    token tok;
    tok.rule = (*rules_)[m->rule].name;
    tok.text = utf8_encode(input.substr(position, m->length));
    tok.span = {position, end};
    tok.location = where();
    return {std::move(tok), end};
  }

  token_stream
  tokenizer::tokenize(std::string_view input) const {
    return token_stream(*this, utf8_decode(input));
  }

  std::vector<token>
  tokenizer::tokenize_all(std::string_view input) const {
    auto stream = tokenize(input);
    std::vector<token> tokens;
    while (auto tok = stream.next())
      tokens.push_back(std::move(*tok));
    return tokens;
  }

  std::vector<std::string>
  tokenizer::alphabet() const {
    std::vector<std::string> names;
    names.reserve(candidates_.size());
    for (auto i : candidates_)
      names.push_back((*rules_)[i].name);
    return names;
  }

  // ---------------------------------------------------------------------------
  // token_stream
  // ---------------------------------------------------------------------------

  token_stream::token_stream(tokenizer lexer, std::u32string input)
      : lexer_(std::move(lexer)), input_(std::move(input)), lines_(input_) {}

  std::optional<token>
  token_stream::next() {
    while (pos_ < input_.size()) {
      auto result = lexer_.step(input_, pos_, &lines_);
      pos_ = result.next;
      if (result.emitted) return std::move(result.emitted);
    }
    return std::nullopt;
  }

  void
  token_stream::skip() {
    if (pos_ < input_.size()) ++pos_;
  }

} // namespace gramc
