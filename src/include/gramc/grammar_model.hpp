#pragma once

#include <gramc/codepoint_matcher.hpp>
#include <gramc/source_location.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace gramc {

  // Forward declarations
  class singular;
  struct alternation;

  enum class rule_kind { token, whitespace, production };

  enum class quantifier { one, maybe, any, many };

  // ---------------------------------------------------------------------------
  // Singular node types
  // ---------------------------------------------------------------------------

  struct nested {
    std::unique_ptr<alternation> body;
  };

  struct symbol_ref {
    std::string name;
    source_location location;
  };

  // A fixed sequence of code points, from a string or character literal.
  struct literal {
    std::string text; // as written in the grammar source
    std::vector<codepoint_matcher> sequence;
  };

  struct character_set {
    std::string text; // as written in the grammar source
    codepoint_matcher matcher;
  };

  // ---------------------------------------------------------------------------
  // Singular
  // ---------------------------------------------------------------------------

  class singular {
  public:
    using variant_type =
        std::variant<nested, symbol_ref, literal, character_set>;

    singular(variant_type v) : data_(std::move(v)) {}

    singular(nested v) : data_(std::move(v)) {}

    singular(symbol_ref v) : data_(std::move(v)) {}

    singular(literal v) : data_(std::move(v)) {}

    singular(character_set v) : data_(std::move(v)) {}

    singular(const singular&) = delete;
    singular&
    operator=(const singular&) = delete;
    singular(singular&&) = default;
    singular&
    operator=(singular&&) = default;

    const variant_type&
    data() const {
      return data_;
    }

    variant_type&
    data() {
      return data_;
    }

    template <typename T>
    bool
    holds() const {
      return std::holds_alternative<T>(data_);
    }

    template <typename T>
    const T&
    get() const {
      return std::get<T>(data_);
    }

    template <typename T>
    T&
    get() {
      return std::get<T>(data_);
    }

  private:
    variant_type data_;
  };

  // ---------------------------------------------------------------------------
  // Rule bodies
  // ---------------------------------------------------------------------------

  struct repetition {
    singular inner;
    quantifier quantity = quantifier::one;
  };

  struct concatenation {
    std::vector<repetition> items;
  };

  struct alternation {
    std::vector<concatenation> choices;
  };

  // A top-level alternative. Only production alternatives carry a name.
  struct alternative {
    std::optional<std::string> doc;
    std::optional<std::string> name;
    concatenation body;
    source_location location;
  };

  struct rule {
    std::string name;
    rule_kind kind = rule_kind::production;
    std::vector<alternative> alternatives;
    std::size_t first_definition_index = 0;
    std::optional<std::string> doc;
    // Lifted from a literal or character set inside a production body.
    bool synthetic = false;
    source_location location;

    bool
    is_token_kind() const {
      return kind != rule_kind::production;
    }
  };

  inline singular
  make_nested(alternation body) {
    return singular(nested{std::make_unique<alternation>(std::move(body))});
  }

  // Every symbol_ref reachable inside a body, in source order.
  void
  collect_refs(const concatenation& body, std::vector<const symbol_ref*>& out);

  void
  collect_refs(const rule& r, std::vector<const symbol_ref*>& out);

} // namespace gramc
