#include <gramc/rule_registry.hpp>

#include <gramc/comment_matcher.hpp>
#include <gramc/error.hpp>
#include <gramc/pattern_compiler.hpp>
#include <gramc/utf8.hpp>

#include <algorithm>
#include <optional>
#include <stdexcept>

namespace gramc {

  namespace {

    // -------------------------------------------------------------------------
    // Token types
    // -------------------------------------------------------------------------

    enum class token_kind {
      eof,
      identifier,
      produces,      // ::=
      defines_token, // :==
      semicolon,     // ;
      pipe,          // |
      arrow,         // ->
      lparen,        // (
      rparen,        // )
      question,      // ?
      star,          // *
      plus,          // +
      string,        // '...' or "..."
      charset,       // [...]
      charlit,       // #x41
    };

    struct meta_token {
      token_kind kind = token_kind::eof;
      std::u32string_view text;
      std::size_t offset = 0;
      // Docstring written directly before this token, if any.
      std::optional<std::string> doc;
    };

    std::string_view
    rule_kind_name(rule_kind kind) {
      switch (kind) {
        case rule_kind::token:
          return "a token rule";
        case rule_kind::whitespace:
          return "the whitespace rule";
        case rule_kind::production:
          return "a production rule";
      }
      return "a rule";
    }

    bool
    is_space(char32_t c) {
      return c == U' ' || c == U'\t' || c == U'\n' || c == U'\r' ||
             c == U'\v' || c == U'\f';
    }

    bool
    is_symbol_start(char32_t c) {
      return (c >= U'a' && c <= U'z') || (c >= U'A' && c <= U'Z') || c == U'_';
    }

    bool
    is_symbol_char(char32_t c) {
      return is_symbol_start(c) || (c >= U'0' && c <= U'9');
    }

    // Strip comment decoration: a leading '*' on continuation lines and
    // surrounding blank space.
    std::string
    normalize_doc(std::u32string_view body) {
      std::vector<std::u32string_view> lines;
      std::size_t start = 0;
      while (start <= body.size()) {
        auto nl = body.find(U'\n', start);
        if (nl == std::u32string_view::npos) nl = body.size();
        lines.push_back(body.substr(start, nl - start));
        start = nl + 1;
      }

      std::u32string out;
      for (auto line : lines) {
        while (!line.empty() && is_space(line.front()))
          line.remove_prefix(1);
        if (!line.empty() && line.front() == U'*') {
          line.remove_prefix(1);
          if (!line.empty() && line.front() == U' ') line.remove_prefix(1);
        }
        while (!line.empty() && is_space(line.back()))
          line.remove_suffix(1);
        if (!out.empty() || !line.empty()) {
          if (!out.empty()) out += U'\n';
          out += line;
        }
      }
      while (!out.empty() && is_space(out.back()))
        out.pop_back();
      return utf8_encode(out);
    }

    // -------------------------------------------------------------------------
    // Lexer
    // -------------------------------------------------------------------------

    class lexer {
    public:
      explicit lexer(std::u32string_view source) : src_(source) {}

      // Throws grammar_error(syntax) with the offending offset. The parser
      // anchors it onto a line and rule.
      meta_token
      next() {
        auto doc = skip_trivia();
        meta_token tok;
        tok.doc = std::move(doc);
        tok.offset = pos_;
        if (pos_ >= src_.size()) return tok;

        char32_t c = src_[pos_];
        auto single = [&](token_kind k) {
          tok.kind = k;
          tok.text = src_.substr(pos_++, 1);
          return tok;
        };

        if (is_symbol_start(c)) {
          std::size_t end = pos_;
          while (end < src_.size() && is_symbol_char(src_[end]))
            ++end;
          tok.kind = token_kind::identifier;
          return take(tok, end);
        }

        switch (c) {
          case U':':
            if (src_.substr(pos_, 3) == U"::=") {
              tok.kind = token_kind::produces;
              return take(tok, pos_ + 3);
            }
            if (src_.substr(pos_, 3) == U":==") {
              tok.kind = token_kind::defines_token;
              return take(tok, pos_ + 3);
            }
            fail("expected '::=' or ':=='");
          case U'-':
            if (src_.substr(pos_, 2) == U"->") {
              tok.kind = token_kind::arrow;
              return take(tok, pos_ + 2);
            }
            fail("unexpected '-' (did you mean '->'?)");
          case U';':
            return single(token_kind::semicolon);
          case U'|':
            return single(token_kind::pipe);
          case U'(':
            return single(token_kind::lparen);
          case U')':
            return single(token_kind::rparen);
          case U'?':
            return single(token_kind::question);
          case U'*':
            return single(token_kind::star);
          case U'+':
            return single(token_kind::plus);
          case U'\'':
          case U'"':
            tok.kind = token_kind::string;
            return take(tok, scan_delimited(c, "string literal"));
          case U'[':
            tok.kind = token_kind::charset;
            return take(tok, scan_delimited(U']', "character set"));
          case U'#':
            tok.kind = token_kind::charlit;
            return take(tok, pos_ + escape_extent(src_, pos_));
          default:
            break;
        }

        fail("unexpected character '" + utf8_encode(src_.substr(pos_, 1)) +
             "'");
      }

    private:
      std::u32string_view src_;
      std::size_t pos_ = 0;

      [[noreturn]] void
      fail(const std::string& msg) {
        throw grammar_error(grammar_errc::syntax, msg, {}, {pos_, 1, 1});
      }

      meta_token&
      take(meta_token& tok, std::size_t end) {
        tok.text = src_.substr(pos_, end - pos_);
        pos_ = end;
        return tok;
      }

      // Offset one past the closing delimiter. Escapes are skipped whole so
      // that #' #" and #] never close the pattern.
      std::size_t
      scan_delimited(char32_t close, const std::string& what) {
        std::size_t i = pos_ + 1;
        while (i < src_.size() && src_[i] != close) {
          if (src_[i] == U'#')
            i += escape_extent(src_, i);
          else
            ++i;
        }
        if (i >= src_.size()) fail("unterminated " + what);
        return i + 1;
      }

      std::optional<std::string>
      skip_trivia() {
        std::optional<std::string> doc;
        while (pos_ < src_.size()) {
          if (is_space(src_[pos_])) {
            ++pos_;
            continue;
          }
          if (src_.substr(pos_, 2) == U"/*") {
            auto m = match_comment(src_, pos_);
            if (!m) fail("unterminated comment");
            if (m->doc) {
              auto text = normalize_doc(
                  src_.substr(m->body_begin, m->body_end - m->body_begin));
              if (doc && !doc->empty())
                *doc += "\n" + text;
              else
                doc = std::move(text);
            }
            pos_ = m->end;
            continue;
          }
          break;
        }
        return doc;
      }
    };

  } // namespace

  namespace detail {

    // -------------------------------------------------------------------------
    // Parser
    // -------------------------------------------------------------------------

    // Fixed recursive-descent parser for the meta-grammar:
    //
    //   rule        ::= doc? symbol ("::=" | ":==") alternative
    //                   ("|" alternative)* ";"
    //   alternative ::= doc? repetition+ ("->" symbol)?
    //   repetition  ::= singular ("?" | "*" | "+")?
    //   singular    ::= "(" repetition+ ("|" repetition+)* ")"
    //                 | symbol | string | charset | charlit
    class meta_parser {
    public:
      meta_parser(rule_registry& registry, std::u32string_view source)
          : registry_(registry), lines_(source), lex_(source) {
        advance();
      }

      void
      parse_grammar() {
        while (current_.kind != token_kind::eof)
          parse_rule();
      }

    private:
      rule_registry& registry_;
      line_index lines_;
      lexer lex_;
      meta_token current_;
      std::string rule_name_;
      rule_kind kind_ = rule_kind::production;

      source_location
      where(std::size_t offset) const {
        return lines_.locate(offset);
      }

      void
      advance() {
        try {
          current_ = lex_.next();
        } catch (const grammar_error& e) {
          throw e.rebase(rule_name_, where(e.location().offset));
        }
      }

      [[noreturn]] void
      error(const std::string& msg) {
        throw grammar_error(grammar_errc::syntax, msg, rule_name_,
                            where(current_.offset));
      }

      std::string
      describe_current() const {
        if (current_.kind == token_kind::eof) return "end of input";
        return "'" + utf8_encode(current_.text) + "'";
      }

      void
      expect(token_kind k, const std::string& what) {
        if (current_.kind != k)
          error("expected " + what + ", got " + describe_current());
        advance();
      }

      bool
      match(token_kind k) {
        if (current_.kind == k) {
          advance();
          return true;
        }
        return false;
      }

      bool
      is_singular_start() const {
        switch (current_.kind) {
          case token_kind::identifier:
          case token_kind::lparen:
          case token_kind::string:
          case token_kind::charset:
          case token_kind::charlit:
            return true;
          default:
            return false;
        }
      }

      // -----------------------------------------------------------------------
      // Rules
      // -----------------------------------------------------------------------

      void
      parse_rule() {
        if (current_.kind != token_kind::identifier)
          error("expected rule name, got " + describe_current());

        rule r;
        r.doc = current_.doc;
        r.name = utf8_encode(current_.text);
        r.location = where(current_.offset);
        r.first_definition_index = registry_.reserve_index();
        rule_name_ = r.name;
        advance();

        if (current_.kind == token_kind::produces) {
          r.kind = rule_kind::production;
        } else if (current_.kind == token_kind::defines_token) {
          r.kind = r.name == "_" ? rule_kind::whitespace : rule_kind::token;
        } else {
          error("expected '::=' or ':==' after rule name, got " +
                describe_current());
        }
        if (r.name == "_" && r.kind == rule_kind::production)
          throw grammar_error(grammar_errc::conflicting_kind,
                              "'_' is the whitespace rule and must be "
                              "defined with ':=='",
                              r.name, r.location);
        kind_ = r.kind;
        advance();

        r.alternatives = parse_alternatives();

        if (current_.kind == token_kind::rparen) error("unmatched ')'");
        expect(token_kind::semicolon, "';' to end rule '" + r.name + "'");

        registry_.merge(std::move(r));
        rule_name_.clear();
      }

      std::vector<alternative>
      parse_alternatives() {
        std::vector<alternative> alts;
        do {
          alternative alt;
          alt.doc = current_.doc;
          alt.location = where(current_.offset);
          alt.body = parse_concatenation();
          if (current_.kind == token_kind::arrow) {
            if (kind_ != rule_kind::production)
              error("alternative names are only allowed in production rules");
            advance();
            if (current_.kind != token_kind::identifier)
              error("expected alternative name after '->', got " +
                    describe_current());
            alt.name = utf8_encode(current_.text);
            advance();
          }
          alts.push_back(std::move(alt));
        } while (match(token_kind::pipe));
        return alts;
      }

      concatenation
      parse_concatenation() {
        concatenation c;
        while (is_singular_start())
          c.items.push_back(parse_repetition());
        if (c.items.empty())
          error("expected a pattern, got " + describe_current());
        return c;
      }

      repetition
      parse_repetition() {
        auto inner = parse_singular();
        quantifier q = quantifier::one;
        if (match(token_kind::question))
          q = quantifier::maybe;
        else if (match(token_kind::star))
          q = quantifier::any;
        else if (match(token_kind::plus))
          q = quantifier::many;
        return repetition{std::move(inner), q};
      }

      singular
      parse_singular() {
        auto tok = current_;
        auto text = utf8_encode(tok.text);
        auto loc = where(tok.offset);

        switch (tok.kind) {
          case token_kind::lparen: {
            advance();
            alternation group;
            do {
              group.choices.push_back(parse_concatenation());
            } while (match(token_kind::pipe));
            if (current_.kind == token_kind::arrow)
              error("alternative names are not allowed inside parentheses");
            if (current_.kind != token_kind::rparen)
              error("expected ')' to close '(' at " + loc.to_string() +
                    ", got " + describe_current());
            advance();
            return make_nested(std::move(group));
          }
          case token_kind::identifier:
            advance();
            return symbol_ref{text, loc};
          case token_kind::string:
            advance();
            return token_pattern(
                literal{text, compile(tok, compile_string_literal)}, text,
                loc);
          case token_kind::charset:
            advance();
            return token_pattern(
                character_set{text, compile(tok, compile_character_set)}, text,
                loc);
          case token_kind::charlit:
            advance();
            return token_pattern(
                literal{text, {compile(tok, compile_character_literal)}}, text,
                loc);
          default:
            error("expected a pattern, got " + describe_current());
        }
      }

      // Pattern compiler errors carry offsets relative to the pattern text.
      template <typename Fn>
      auto
      compile(const meta_token& tok, Fn fn) -> decltype(fn(tok.text)) {
        try {
          return fn(tok.text);
        } catch (const grammar_error& e) {
          throw e.rebase(rule_name_, where(tok.offset + e.location().offset));
        }
      }

      // Literals and sets written inside a production become references to
      // synthetic token rules; inside token rules they stay inline.
      singular
      token_pattern(singular pattern, const std::string& text,
                    const source_location& loc) {
        if (kind_ != rule_kind::production) return pattern;
        auto name = registry_.lift(std::move(pattern), text, loc);
        return symbol_ref{name, loc};
      }
    };

  } // namespace detail

  // ---------------------------------------------------------------------------
  // Registry
  // ---------------------------------------------------------------------------

  void
  rule_registry::add(std::string_view source) {
    if (finalized_)
      throw std::logic_error("rule_registry: add() after finalize()");

    std::u32string text;
    try {
      text = utf8_decode(source, true);
    } catch (const std::invalid_argument& e) {
      throw grammar_error(grammar_errc::syntax, e.what());
    }

    detail::meta_parser parser(*this, text);
    parser.parse_grammar();
  }

  void
  rule_registry::merge(rule r) {
    auto it = by_name_.find(r.name);
    if (it == by_name_.end()) {
      by_name_.emplace(r.name, rules_.size());
      rules_.push_back(std::move(r));
      return;
    }

    auto& existing = rules_[it->second];
    if (existing.kind != r.kind)
      throw grammar_error(
          grammar_errc::conflicting_kind,
          "defined as " + std::string(rule_kind_name(existing.kind)) +
              " at " + existing.location.to_string() + " and redefined as " +
              std::string(rule_kind_name(r.kind)),
          r.name, r.location);

    for (auto& alt : r.alternatives)
      existing.alternatives.push_back(std::move(alt));
    if (r.doc) {
      if (existing.doc)
        *existing.doc += "\n" + *r.doc;
      else
        existing.doc = std::move(r.doc);
    }
  }

  std::string
  rule_registry::lift(singular pattern, const std::string& text,
                      const source_location& location) {
    if (by_name_.count(text)) return text;

    rule r;
    r.name = text;
    r.kind = rule_kind::token;
    r.synthetic = true;
    r.location = location;
    r.first_definition_index = reserve_index();

    alternative alt;
    alt.location = location;
    alt.body.items.push_back(repetition{std::move(pattern), quantifier::one});
    r.alternatives.push_back(std::move(alt));

    merge(std::move(r));
    return text;
  }

  std::shared_ptr<const rule_set>
  rule_registry::finalize() {
    if (finalized_)
      throw std::logic_error("rule_registry: finalize() called twice");
    finalized_ = true;

    for (const auto& r : rules_) {
      std::vector<const symbol_ref*> refs;
      collect_refs(r, refs);
      for (const auto* ref : refs) {
        if (!by_name_.count(ref->name))
          throw grammar_error(grammar_errc::undefined_symbol,
                              "reference to undefined rule '" + ref->name +
                                  "'",
                              r.name, ref->location);
      }
    }

    by_name_.clear();
    return std::make_shared<const rule_set>(std::move(rules_));
  }

} // namespace gramc
