#pragma once

#include <gramc/source_location.hpp>

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace gramc {

  // ---------------------------------------------------------------------------
  // Compile-time errors
  // ---------------------------------------------------------------------------

  enum class grammar_errc {
    syntax,
    conflicting_kind,
    empty_literal,
    invalid_escape,
    recursive_token,
    duplicate_variant_name,
    undefined_symbol,
    invalid_token_reference,
  };

  std::string_view
  to_string(grammar_errc kind);

  class grammar_error : public std::runtime_error {
  public:
    grammar_error(grammar_errc kind, std::string detail,
                  std::string rule_name = {}, source_location location = {});

    grammar_errc
    kind() const {
      return kind_;
    }

    const std::string&
    detail() const {
      return detail_;
    }

    // Empty when the error is not tied to one rule.
    const std::string&
    rule_name() const {
      return rule_name_;
    }

    const source_location&
    location() const {
      return location_;
    }

    // Same error, re-anchored onto a rule and grammar source location.
    grammar_error
    rebase(std::string rule_name, source_location location) const;

  private:
    grammar_errc kind_;
    std::string detail_;
    std::string rule_name_;
    source_location location_;
  };

  // ---------------------------------------------------------------------------
  // Run-time errors
  // ---------------------------------------------------------------------------

  class lex_error : public std::runtime_error {
  public:
    // `tried_rules` lists the competing rule names in definition order.
    lex_error(source_location location, std::vector<std::string> tried_rules);

    std::size_t
    position() const {
      return location_.offset;
    }

    const source_location&
    location() const {
      return location_;
    }

    const std::vector<std::string>&
    tried_rules() const {
      return tried_rules_;
    }

  private:
    source_location location_;
    std::vector<std::string> tried_rules_;
  };

  enum class parse_errc { no_alternative_matched, no_progress, depth_exceeded };

  std::string_view
  to_string(parse_errc kind);

  class parse_error : public std::runtime_error {
  public:
    parse_error(parse_errc kind, source_location location,
                std::string rule_name, std::vector<std::string> tried_rules);

    parse_errc
    kind() const {
      return kind_;
    }

    std::size_t
    position() const {
      return location_.offset;
    }

    const source_location&
    location() const {
      return location_;
    }

    const std::string&
    rule_name() const {
      return rule_name_;
    }

    const std::vector<std::string>&
    tried_rules() const {
      return tried_rules_;
    }

  private:
    parse_errc kind_;
    source_location location_;
    std::string rule_name_;
    std::vector<std::string> tried_rules_;
  };

} // namespace gramc
