#include <gramc/parser.hpp>

#include <gramc/error.hpp>
#include <gramc/utf8.hpp>

#include <algorithm>
#include <cstddef>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace gramc {

  namespace {

    constexpr std::size_t no_rule = static_cast<std::size_t>(-1);

    source_span
    span_of(const ast_child& child) {
      return child.is_token() ? child.as_token().span : child.as_node().span;
    }

    // One parse run. Positions are code-point offsets in raw mode and token
    // indices in token mode.
    class evaluator {
    public:
      evaluator(const rule_set& rules, const variant_table& variants,
                const token_automaton& automaton, const parse_options& options,
                std::u32string_view text, const std::vector<token>* tokens)
          : rules_(rules), variants_(variants), automaton_(automaton),
            options_(options), text_(text), lines_(text), tokens_(tokens) {
        if (const auto* ws = rules_.whitespace())
          whitespace_ = rules_.index_of(ws->name);
      }

      ast_node
      run(std::size_t start, bool whole) {
        start_ = rules_[start].name;
        std::size_t pos = 0;
        skip_whitespace(pos);

        ast_node root;
        if (!invoke(start, pos, root)) fail();
        if (whole && pos != end()) {
          if (farthest_ < pos) {
            farthest_ = pos;
            tried_.clear();
          }
          fail();
        }
        return root;
      }

    private:
      const rule_set& rules_;
      const variant_table& variants_;
      const token_automaton& automaton_;
      const parse_options& options_;
      std::u32string_view text_;
      line_index lines_;
      const std::vector<token>* tokens_;
      std::size_t whitespace_ = no_rule;
      std::string start_;

      std::set<std::pair<std::size_t, std::size_t>> active_;
      std::size_t depth_ = 0;

      std::size_t farthest_ = 0;
      std::vector<std::string> tried_;

      bool
      token_mode() const {
        return tokens_ != nullptr;
      }

      std::size_t
      end() const {
        return token_mode() ? tokens_->size() : text_.size();
      }

      // Source offset of a cursor position.
      std::size_t
      offset(std::size_t pos) const {
        if (!token_mode()) return pos;
        if (pos < tokens_->size()) return (*tokens_)[pos].span.begin;
        return tokens_->empty() ? 0 : tokens_->back().span.end;
      }

      source_location
      location(std::size_t pos) const {
        if (!token_mode()) return lines_.locate(pos);
        if (pos < tokens_->size()) return (*tokens_)[pos].location;
        if (tokens_->empty()) return {};
        // End of the last token, walked from its start so that a token
        // spanning a newline lands on the right line.
        const auto& last = tokens_->back();
        source_location end = last.location;
        for (char32_t c : utf8_decode(last.text)) {
          if (c == U'\n') {
            ++end.line;
            end.column = 1;
          } else {
            ++end.column;
          }
        }
        end.offset = last.span.end;
        return end;
      }

      [[noreturn]] void
      fail() const {
        throw parse_error(parse_errc::no_alternative_matched,
                          location(farthest_), start_, tried_);
      }

      void
      note_failure(std::size_t pos, const std::string& name) {
        if (pos > farthest_) {
          farthest_ = pos;
          tried_.clear();
        } else if (pos < farthest_) {
          return;
        }
        if (std::find(tried_.begin(), tried_.end(), name) == tried_.end())
          tried_.push_back(name);
      }

      void
      skip_whitespace(std::size_t& pos) const {
        if (token_mode() || whitespace_ == no_rule) return;
        while (pos < text_.size()) {
          auto len = automaton_.match_rule(text_, pos, whitespace_);
          if (!len) break;
          pos += *len;
        }
      }

      static void
      truncate(std::vector<ast_child>& out, std::size_t size) {
        out.erase(out.begin() + static_cast<std::ptrdiff_t>(size), out.end());
      }

      bool
      invoke(std::size_t index, std::size_t& pos, ast_node& node) {
        const auto& r = rules_[index];
        if (depth_ >= options_.max_depth)
          throw parse_error(parse_errc::depth_exceeded, location(pos), r.name,
                            {});

        auto key = std::make_pair(index, pos);
        if (!active_.insert(key).second)
          throw parse_error(parse_errc::no_progress, location(pos), r.name, {});
        ++depth_;

        const auto* type = variants_.find(r.name);
        bool matched = false;
        for (std::size_t i = 0; i < r.alternatives.size() && !matched; ++i) {
          std::size_t at = pos;
          std::vector<ast_child> children;
          if (!eval(r.alternatives[i].body, at, children)) continue;

          node.rule = r.name;
          node.variant = type ? type->variants[i].tag
                              : r.name + "_" + std::to_string(i + 1);
          node.span = children.empty()
                          ? source_span{offset(pos), offset(pos)}
                          : source_span{span_of(children.front()).begin,
                                        span_of(children.back()).end};
          node.children = std::move(children);
          pos = at;
          matched = true;
        }

        --depth_;
        active_.erase(key);
        if (!matched) note_failure(pos, r.name);
        return matched;
      }

      bool
      eval(const concatenation& body, std::size_t& pos,
           std::vector<ast_child>& out) {
        for (const auto& item : body.items)
          if (!eval(item, pos, out)) return false;
        return true;
      }

      bool
      eval(const repetition& item, std::size_t& pos,
           std::vector<ast_child>& out) {
        switch (item.quantity) {
          case quantifier::one:
            return attempt(item.inner, pos, out);
          case quantifier::maybe:
            attempt(item.inner, pos, out);
            return true;
          case quantifier::any:
          case quantifier::many: {
            std::size_t count = 0;
            for (;;) {
              auto before = pos;
              if (!attempt(item.inner, pos, out)) break;
              ++count;
              if (pos == before) break;
            }
            return item.quantity == quantifier::any || count > 0;
          }
        }
        return false;
      }

      // Evaluate one singular, restoring the cursor and output on failure.
      bool
      attempt(const singular& s, std::size_t& pos,
              std::vector<ast_child>& out) {
        auto saved_pos = pos;
        auto saved_size = out.size();
        if (eval(s, pos, out)) {
          skip_whitespace(pos);
          return true;
        }
        pos = saved_pos;
        truncate(out, saved_size);
        return false;
      }

      bool
      eval(const singular& s, std::size_t& pos, std::vector<ast_child>& out) {
        return std::visit(
            [&](const auto& node) -> bool {
              using T = std::decay_t<decltype(node)>;

              if constexpr (std::is_same_v<T, nested>) {
                for (const auto& choice : node.body->choices) {
                  auto saved_pos = pos;
                  auto saved_size = out.size();
                  if (eval(choice, pos, out)) return true;
                  pos = saved_pos;
                  truncate(out, saved_size);
                }
                return false;
              } else if constexpr (std::is_same_v<T, symbol_ref>) {
                return eval_ref(node, pos, out);
              } else {
                throw std::logic_error(
                    "parser: unlifted pattern in production body: " +
                    node.text);
              }
            },
            s.data());
      }

      bool
      eval_ref(const symbol_ref& ref, std::size_t& pos,
               std::vector<ast_child>& out) {
        auto index = rules_.index_of(ref.name);
        const auto& r = rules_[index];

        switch (r.kind) {
          case rule_kind::production: {
            auto child = std::make_unique<ast_node>();
            if (!invoke(index, pos, *child)) return false;
            out.emplace_back(std::move(child));
            return true;
          }
          case rule_kind::whitespace:
            skip_whitespace(pos);
            return true;
          case rule_kind::token:
            return match_token(index, pos, out);
        }
        return false;
      }

      bool
      match_token(std::size_t index, std::size_t& pos,
                  std::vector<ast_child>& out) {
        const auto& name = rules_[index].name;

        if (token_mode()) {
          if (pos < tokens_->size() && (*tokens_)[pos].rule == name) {
            out.emplace_back((*tokens_)[pos]);
            ++pos;
            return true;
          }
          note_failure(pos, name);
          return false;
        }

        auto len = automaton_.match_rule(text_, pos, index);
        if (!len) {
          note_failure(pos, name);
          return false;
        }
        token tok;
        tok.rule = name;
        tok.text = utf8_encode(text_.substr(pos, *len));
        tok.span = {pos, pos + *len};
        tok.location = lines_.locate(pos);
        out.emplace_back(std::move(tok));
        pos += *len;
        return true;
      }
    };

  } // namespace

  parser::parser(std::shared_ptr<const rule_set> rules,
                 std::shared_ptr<const variant_table> variants,
                 std::shared_ptr<const token_automaton> automaton,
                 parse_options options)
      : rules_(std::move(rules)), variants_(std::move(variants)),
        automaton_(std::move(automaton)), options_(options) {}

  std::size_t
  parser::start_index(std::string_view start) const {
    const auto* r = rules_->find(start);
    if (!r)
      throw std::invalid_argument("parser: unknown start symbol: " +
                                  std::string(start));
    if (r->kind != rule_kind::production)
      throw std::invalid_argument("parser: start symbol is not a production: " +
                                  std::string(start));
    return rules_->index_of(start);
  }

  ast_node
  parser::parse(std::string_view start, std::string_view input) const {
    auto index = start_index(start);
    auto text = utf8_decode(input);
    evaluator ev(*rules_, *variants_, *automaton_, options_, text, nullptr);
    return ev.run(index, true);
  }

  ast_node
  parser::parse(std::string_view start,
                const std::vector<token>& tokens) const {
    auto index = start_index(start);
    evaluator ev(*rules_, *variants_, *automaton_, options_, {}, &tokens);
    return ev.run(index, true);
  }

  ast_node
  parser::parse_prefix(std::string_view start, std::string_view input) const {
    auto index = start_index(start);
    auto text = utf8_decode(input);
    evaluator ev(*rules_, *variants_, *automaton_, options_, text, nullptr);
    return ev.run(index, false);
  }

  ast_node
  parser::parse_prefix(std::string_view start,
                       const std::vector<token>& tokens) const {
    auto index = start_index(start);
    evaluator ev(*rules_, *variants_, *automaton_, options_, {}, &tokens);
    return ev.run(index, false);
  }

} // namespace gramc
